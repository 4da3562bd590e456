#pragma once

#include <functional>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace ticketflow::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::vector<model::TruckTicket> QueryTickets(Transaction& t, const std::string& where, const std::function<void(sqlite3_stmt*)>& bind);
  std::vector<model::ReviewQueueEntry> QueryReviews(Transaction& t, const std::string& where, const std::function<void(sqlite3_stmt*)>& bind);
  std::vector<model::ProcessingRun> QueryRuns(Transaction& t, const std::string& tail, const std::function<void(sqlite3_stmt*)>& bind);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace ticketflow::db::sqlite
