#include "processing_run_ledger.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace ticketflow::processing {

using db::model::ProcessingRun;
using db::model::RunStatus;

ProcessingRunLedger::ProcessingRunLedger(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

ProcessingRun ProcessingRunLedger::Start(const std::string& processed_by, std::string request_guid) {
  ProcessingRun run;
  run.request_guid = request_guid.empty() ? util::NewRequestGuid() : std::move(request_guid);
  run.processed_by = processed_by;
  run.started_at   = util::Now();
  run.status       = RunStatus::InProgress;

  auto tx = repository_->Begin();
  util::ThrowIfDbError(repository_->InsertRun(*tx, run), "start run " + run.request_guid);
  tx->Commit();

  TICKETFLOW_LOG_INFO("run started", {observability::StringField("request_guid", run.request_guid), observability::StringField("processed_by", processed_by)});
  return run;
}

ProcessingRun ProcessingRunLedger::LoadOpen(db::Transaction& tx, const std::string& request_guid) {
  auto run = repository_->GetRun(tx, request_guid);
  if (!run) throw util::NotFound("run " + request_guid);
  if (run->status != RunStatus::InProgress) throw util::InvalidState("run " + request_guid + " is sealed");
  return *run;
}

ProcessingRun ProcessingRunLedger::RecordProgress(const std::string& request_guid, const RunDelta& delta) {
  auto tx  = repository_->Begin();
  auto run = LoadOpen(*tx, request_guid);

  run.files_count += delta.files;
  run.pages_count += delta.pages;
  run.ok_count += delta.ok;
  run.error_count += delta.errors;
  run.review_count += delta.reviews;
  run.skipped_count += delta.skipped;

  util::ThrowIfDbError(repository_->UpdateRun(*tx, run), "update run " + request_guid);
  tx->Commit();
  return run;
}

ProcessingRun ProcessingRunLedger::Seal(const std::string& request_guid, RunStatus status) {
  if (status == RunStatus::InProgress) throw util::InvalidState("cannot seal run as IN_PROGRESS");

  auto tx  = repository_->Begin();
  auto run = LoadOpen(*tx, request_guid);

  run.status       = status;
  run.completed_at = util::Now();

  util::ThrowIfDbError(repository_->UpdateRun(*tx, run), "seal run " + request_guid);
  tx->Commit();

  TICKETFLOW_LOG_INFO("run sealed", {observability::StringField("request_guid", request_guid), observability::StringField("status", db::model::ToString(status)),
                                     observability::IntField("files", static_cast<int64_t>(run.files_count)),
                                     observability::IntField("pages", static_cast<int64_t>(run.pages_count)),
                                     observability::IntField("ok", static_cast<int64_t>(run.ok_count)),
                                     observability::IntField("errors", static_cast<int64_t>(run.error_count)),
                                     observability::IntField("reviews", static_cast<int64_t>(run.review_count)),
                                     observability::IntField("skipped", static_cast<int64_t>(run.skipped_count))});
  return run;
}

std::optional<ProcessingRun> ProcessingRunLedger::Get(const std::string& request_guid) {
  auto tx  = repository_->Begin();
  auto run = repository_->GetRun(*tx, request_guid);
  tx->Commit();
  return run;
}

std::vector<ProcessingRun> ProcessingRunLedger::ListRecent(std::size_t limit) {
  auto tx   = repository_->Begin();
  auto runs = repository_->ListRuns(*tx, limit);
  tx->Commit();
  return runs;
}

} // namespace ticketflow::processing
