#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/processed_file.hpp"
#include "internal/db/model/processing_run.hpp"
#include "internal/db/model/reference_entity.hpp"
#include "internal/db/model/review_entry.hpp"
#include "internal/db/model/truck_ticket.hpp"

namespace ticketflow::db {

/*
  Repository abstraction (system of record).

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Committed tickets are unique on (ticket_number, vendor_id, ticket_date);
    a second insert returns ConstraintViolation
  - A ticket whose material requires a manifest is rejected with
    ConstraintViolation unless it carries a valid (6-20 alphanumeric)
    manifest number or is flagged review_required
  - DeleteFileResults clears duplicate_of links to the deleted tickets
  - Insert* assigns ids in place
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------
  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Reference data
  // ---------------------------------------------------------------------
  virtual Result InsertReference(Transaction&, model::ReferenceEntity&) = 0;
  virtual std::optional<model::ReferenceEntity> FindReference(Transaction&, model::ReferenceCategory, const std::string& canonical_name) = 0;
  virtual std::vector<model::ReferenceEntity> ListReferences(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Tickets
  // ---------------------------------------------------------------------
  virtual Result InsertTicket(Transaction&, model::TruckTicket&) = 0;
  virtual std::optional<model::TruckTicket> GetTicket(Transaction&, int64_t id) = 0;

  // Tickets with this number/vendor dated within [from, to], oldest first.
  virtual std::vector<model::TruckTicket> FindTicketsInWindow(Transaction&, const std::string& ticket_number, std::optional<int64_t> vendor_id, const util::Date& from,
                                                              const util::Date& to) = 0;

  virtual std::vector<model::TruckTicket> FindTicketsByManifest(Transaction&, std::optional<int64_t> vendor_id, const util::Date& date, const std::string& manifest_number) = 0;

  virtual std::vector<model::TruckTicket> ListTicketsForFile(Transaction&, const std::string& file_id) = 0;

  // Removes what one run produced for one file (tickets + review entries).
  virtual Result DeleteFileResults(Transaction&, const std::string& file_id, const std::string& request_guid) = 0;

  // ---------------------------------------------------------------------
  // Review queue
  // ---------------------------------------------------------------------
  virtual Result InsertReviewEntry(Transaction&, model::ReviewQueueEntry&) = 0;
  virtual std::optional<model::ReviewQueueEntry> GetReviewEntry(Transaction&, int64_t id) = 0;
  virtual std::vector<model::ReviewQueueEntry> ListReviewEntries(Transaction&, bool unresolved_only) = 0;
  virtual Result MarkReviewResolved(Transaction&, int64_t id, const std::string& resolved_by, util::TimePoint resolved_at) = 0;

  // ---------------------------------------------------------------------
  // Processed-file ledger
  // ---------------------------------------------------------------------
  virtual Result RecordProcessedFile(Transaction&, const model::ProcessedFileRecord&) = 0;
  virtual std::optional<model::ProcessedFileRecord> FindProcessedFile(Transaction&, const std::string& file_hash) = 0;

  // ---------------------------------------------------------------------
  // Processing runs
  // ---------------------------------------------------------------------
  virtual Result InsertRun(Transaction&, const model::ProcessingRun&) = 0;
  virtual Result UpdateRun(Transaction&, const model::ProcessingRun&) = 0;
  virtual std::optional<model::ProcessingRun> GetRun(Transaction&, const std::string& request_guid) = 0;
  virtual std::vector<model::ProcessingRun> ListRuns(Transaction&, std::size_t limit) = 0;
};

} // namespace ticketflow::db
