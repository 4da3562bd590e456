#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace ticketflow::db::memory {

class MemoryTransaction;

/*
  In-process backend used by tests and dry runs.

  Enforces the same constraints as the sqlite schema (uniqueness,
  manifest rule, reference foreign keys) so both backends are
  interchangeable.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertReference(Transaction&, model::ReferenceEntity&) override;
  std::optional<model::ReferenceEntity> FindReference(Transaction&, model::ReferenceCategory, const std::string&) override;
  std::vector<model::ReferenceEntity> ListReferences(Transaction&) override;

  Result InsertTicket(Transaction&, model::TruckTicket&) override;
  std::optional<model::TruckTicket> GetTicket(Transaction&, int64_t) override;
  std::vector<model::TruckTicket> FindTicketsInWindow(Transaction&, const std::string&, std::optional<int64_t>, const util::Date&, const util::Date&) override;
  std::vector<model::TruckTicket> FindTicketsByManifest(Transaction&, std::optional<int64_t>, const util::Date&, const std::string&) override;
  std::vector<model::TruckTicket> ListTicketsForFile(Transaction&, const std::string&) override;
  Result DeleteFileResults(Transaction&, const std::string&, const std::string&) override;

  Result InsertReviewEntry(Transaction&, model::ReviewQueueEntry&) override;
  std::optional<model::ReviewQueueEntry> GetReviewEntry(Transaction&, int64_t) override;
  std::vector<model::ReviewQueueEntry> ListReviewEntries(Transaction&, bool) override;
  Result MarkReviewResolved(Transaction&, int64_t, const std::string&, util::TimePoint) override;

  Result RecordProcessedFile(Transaction&, const model::ProcessedFileRecord&) override;
  std::optional<model::ProcessedFileRecord> FindProcessedFile(Transaction&, const std::string&) override;

  Result InsertRun(Transaction&, const model::ProcessingRun&) override;
  Result UpdateRun(Transaction&, const model::ProcessingRun&) override;
  std::optional<model::ProcessingRun> GetRun(Transaction&, const std::string&) override;
  std::vector<model::ProcessingRun> ListRuns(Transaction&, std::size_t) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<int64_t, model::ReferenceEntity>  references;
    std::map<int64_t, model::TruckTicket>      tickets;
    std::map<int64_t, model::ReviewQueueEntry> reviews;

    std::map<std::string, model::ProcessedFileRecord> processed_files;
    std::map<std::string, model::ProcessingRun>       runs;

    int64_t next_reference_id = 1;
    int64_t next_ticket_id    = 1;
    int64_t next_review_id    = 1;
  };

  std::mutex mutex_;
  State      committed_;
};

} // namespace ticketflow::db::memory
