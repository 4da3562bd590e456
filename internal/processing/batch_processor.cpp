#include "batch_processor.hpp"

#include <algorithm>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/processing/file_queue.hpp"
#include "internal/processing/file_worker.hpp"
#include "internal/processing/filename_parser.hpp"
#include "internal/processing/processing_run_ledger.hpp"
#include "internal/reference/reference_cache.hpp"
#include "internal/util/errors.hpp"

namespace ticketflow::processing {
namespace {

class FileCancelled : public std::runtime_error {
 public:
  FileCancelled() : std::runtime_error("cancelled") {
  }
};

using SteadyClock = std::chrono::steady_clock;

} // namespace

std::string_view ToString(FileStatus status) {
  switch (status) {
  case FileStatus::Completed:
    return "COMPLETED";
  case FileStatus::AlreadyProcessed:
    return "ALREADY_PROCESSED";
  case FileStatus::Error:
    return "ERROR";
  case FileStatus::Skipped:
    return "SKIPPED";
  case FileStatus::Cancelled:
    return "CANCELLED";
  }
  return "UNKNOWN";
}

BatchProcessor::BatchProcessor(std::shared_ptr<db::Repository> repository, std::shared_ptr<const templates::TemplateCatalog> catalog,
                               std::shared_ptr<const normalize::SynonymNormalizer> normalizer, ProcessorSettings settings, DocumentSourceFactory sources,
                               BatchOptions options)
    : repository_(std::move(repository)),
      catalog_(std::move(catalog)),
      normalizer_(std::move(normalizer)),
      settings_(std::move(settings)),
      sources_(std::move(sources)),
      options_(std::move(options)) {
}

void BatchProcessor::Cancel() {
  {
    std::lock_guard lock(cancel_mutex_);
    cancelled_ = true;
  }
  cancel_cv_.notify_all();
}

bool BatchProcessor::Backoff(std::chrono::milliseconds delay) {
  std::unique_lock lock(cancel_mutex_);
  return !cancel_cv_.wait_for(lock, delay, [&] { return cancelled_.load(); });
}

bool BatchProcessor::Rollback(const std::string& file_id, const std::string& request_guid) {
  try {
    auto tx = repository_->Begin();
    util::ThrowIfDbError(repository_->DeleteFileResults(*tx, file_id, request_guid), "rollback " + file_id);
    tx->Commit();
  } catch (const std::exception& e) {
    TICKETFLOW_LOG_ERROR("file rollback failed", {observability::StringField("file", file_id), observability::StringField("error", e.what())});
    observability::Metrics::Instance().RecordRollback(false);
    return false;
  }
  observability::Metrics::Instance().RecordRollback(true);
  TICKETFLOW_LOG_WARN("file results rolled back", {observability::StringField("file", file_id), observability::StringField("request_guid", request_guid)});
  return true;
}

// ------------------------------------------------------------
// One attempt over one file
// ------------------------------------------------------------

void BatchProcessor::Attempt(TicketProcessor& processor, DocumentSource& source, FileContext& context, const std::string& path, FileResult& result) {
  result.pages = 0;
  result.ticket_ids.clear();
  result.review_ids.clear();
  context.last_orientation.reset();

  auto reader = source.Open(path);
  const int count = reader->PageCount();

  for (int i = 0; i < count; ++i) {
    if (cancelled_) throw FileCancelled();

    auto outcome = processor.ProcessPage(context, reader->ReadPage(i));
    ++result.pages;
    if (outcome.ticket_id) result.ticket_ids.push_back(*outcome.ticket_id);
    if (outcome.review_id) result.review_ids.push_back(*outcome.review_id);
  }

  if (options_.check_duplicate_files && !context.file_hash.empty()) {
    db::model::ProcessedFileRecord record;
    record.file_hash    = context.file_hash;
    record.file_id      = context.file_id;
    record.request_guid = context.request_guid;
    record.processed_at = util::Now();
    record.ticket_ids   = result.ticket_ids;
    record.review_ids   = result.review_ids;

    auto tx = repository_->Begin();
    auto r  = repository_->RecordProcessedFile(*tx, record);
    // identical bytes under another path within this batch: first one keeps the ledger row
    if (r.code != db::ErrorCode::AlreadyExists) util::ThrowIfDbError(r, "record processed file " + path);
    tx->Commit();
  }
}

FileResult BatchProcessor::ProcessFile(TicketProcessor& processor, DocumentSource& source, const std::string& path, const std::string& request_guid) {
  const auto start = SteadyClock::now();

  observability::SpanScope span("ticketflow.file");
  span.SetAttribute("file", path);

  FileResult result;
  result.file_id = path;

  auto finish = [&](FileStatus status) {
    result.status   = status;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start);

    span.SetAttribute("status", ToString(status));
    span.SetAttribute("attempts", static_cast<std::int64_t>(result.attempts));
    if (status == FileStatus::Error) span.RecordException(result.error);
    auto& metrics = observability::Metrics::Instance();
    metrics.RecordFile(ToString(status), result.attempts);
    metrics.ObserveFileDurationMs(static_cast<double>(result.duration.count()));
    return result;
  };

  if (cancelled_) return finish(FileStatus::Skipped);

  FileContext context;
  context.file_id      = path;
  context.request_guid = request_guid;

  auto delay = options_.initial_backoff;
  for (int attempt = 1;; ++attempt) {
    result.attempts = attempt;
    try {
      if (attempt == 1) context.hints = ParseFilename(path);

      if (context.file_hash.empty()) {
        context.file_hash = source.HashFile(path);
        result.file_hash  = context.file_hash;
      }

      if (options_.check_duplicate_files) {
        auto tx    = repository_->Begin();
        auto known = repository_->FindProcessedFile(*tx, context.file_hash);
        tx->Commit();
        if (known) {
          result.ticket_ids = known->ticket_ids;
          result.review_ids = known->review_ids;
          TICKETFLOW_LOG_INFO("file already processed", {observability::StringField("file", path), observability::StringField("original_run", known->request_guid)});
          return finish(FileStatus::AlreadyProcessed);
        }
      }

      Attempt(processor, source, context, path, result);
      return finish(FileStatus::Completed);

    } catch (const FileCancelled&) {
      if (!Rollback(path, request_guid)) result.error = "cancelled; rollback of partial results failed";
      result.ticket_ids.clear();
      result.review_ids.clear();
      return finish(FileStatus::Cancelled);

    } catch (const util::TransientError& e) {
      result.error = e.what();
      // a retry must not see its own earlier pages as duplicates
      if (!Rollback(path, request_guid)) {
        result.error += "; rollback failed";
        break;
      }
      if (attempt > options_.max_retries) break;

      TICKETFLOW_LOG_WARN("transient failure, retrying", {observability::StringField("file", path), observability::IntField("attempt", attempt),
                                                          observability::IntField("backoff_ms", delay.count()),
                                                          observability::StringField("error", e.what())});
      span.AddEvent("retry");
      if (!Backoff(delay)) return finish(FileStatus::Cancelled);
      delay = std::chrono::milliseconds(static_cast<int64_t>(static_cast<double>(delay.count()) * options_.backoff_multiplier));

    } catch (const std::exception& e) {
      result.error = e.what();
      if (!Rollback(path, request_guid)) result.error += "; rollback failed";
      break;

    } catch (...) {
      result.error = "unknown exception";
      if (!Rollback(path, request_guid)) result.error += "; rollback failed";
      break;
    }
  }

  result.ticket_ids.clear();
  result.review_ids.clear();
  TICKETFLOW_LOG_ERROR("file failed", {observability::StringField("file", path), observability::IntField("attempts", result.attempts),
                                       observability::StringField("error", result.error)});
  return finish(FileStatus::Error);
}

// ------------------------------------------------------------
// Batch
// ------------------------------------------------------------

BatchResult BatchProcessor::Run(const std::vector<std::string>& files, const ProgressCallback& progress) {
  const auto start = SteadyClock::now();

  ProcessingRunLedger ledger(repository_);
  BatchResult         batch;
  batch.run = ledger.Start(options_.processed_by);
  const auto guid = batch.run.request_guid;

  observability::SpanScope span("ticketflow.batch.run");
  span.SetAttribute("request_guid", guid);

  auto references = std::make_shared<reference::ReferenceCache>(repository_);
  if (options_.preload_references) references->Preload();

  TicketProcessor processor(repository_, references, catalog_, normalizer_, settings_);

  std::size_t workers = options_.workers;
  if (workers == 0) workers = std::max(1u, std::thread::hardware_concurrency());
  workers = std::max<std::size_t>(1, std::min(workers, files.size()));

  span.SetAttribute("files", static_cast<std::int64_t>(files.size()));
  span.SetAttribute("workers", static_cast<std::int64_t>(workers));
  TICKETFLOW_LOG_INFO("batch started", {observability::StringField("request_guid", guid), observability::IntField("files", static_cast<int64_t>(files.size())),
                                        observability::IntField("workers", static_cast<int64_t>(workers))});

  std::mutex    progress_mutex;
  BatchProgress totals;
  totals.files_total = files.size();
  std::string ledger_error;

  auto queue = std::make_shared<FileQueue>();
  for (std::size_t i = 0; i < files.size(); ++i) queue->Enqueue(FileTask{i, files[i]});
  queue->Shutdown();

  // Every file reaches here exactly once, from handle or from fail.
  auto record = [&](FileResult result) {
    RunDelta delta;
    delta.files = 1;
    if (result.status == FileStatus::Completed) {
      delta.pages   = static_cast<uint64_t>(result.pages);
      delta.ok      = result.ticket_ids.size();
      delta.reviews = result.review_ids.size();
    } else if (result.status == FileStatus::Error) {
      delta.errors = 1;
    } else if (result.status == FileStatus::Skipped || result.status == FileStatus::Cancelled) {
      delta.skipped = 1;
    }

    TICKETFLOW_LOG_INFO("file finished", {observability::StringField("file", result.file_id), observability::StringField("status", ToString(result.status)),
                                          observability::IntField("attempts", result.attempts), observability::IntField("pages", result.pages),
                                          observability::IntField("tickets", static_cast<int64_t>(result.ticket_ids.size())),
                                          observability::IntField("reviews", static_cast<int64_t>(result.review_ids.size())),
                                          observability::IntField("duration_ms", result.duration.count())});

    std::lock_guard lock(progress_mutex);
    try {
      ledger.RecordProgress(guid, delta);
    } catch (const std::exception& e) {
      if (ledger_error.empty()) ledger_error = e.what();
      TICKETFLOW_LOG_ERROR("run ledger update failed", {observability::StringField("request_guid", guid), observability::StringField("error", e.what())});
    }

    batch.files.push_back(std::move(result));
    totals.files_done++;
    totals.pages_count += delta.pages;
    totals.ok_count += delta.ok;
    totals.error_count += delta.errors;
    totals.review_count += delta.reviews;
    totals.last = &batch.files.back();
    if (progress) {
      try {
        progress(totals);
      } catch (const std::exception& e) {
        TICKETFLOW_LOG_ERROR("progress callback threw", {observability::StringField("file", batch.files.back().file_id), observability::StringField("error", e.what())});
      }
    }
    totals.last = nullptr;
  };

  auto handle = [&](DocumentSource& source, const FileTask& task) { record(ProcessFile(processor, source, task.path, guid)); };

  // Reached only when something escaped ProcessFile; the file still gets an ERROR row.
  auto fail = [&](const FileTask& task, const std::string& error) {
    FileResult result;
    result.file_id = task.path;
    result.status  = FileStatus::Error;
    result.error   = error;
    if (!Rollback(task.path, guid)) result.error += "; rollback failed";
    observability::Metrics::Instance().RecordFile(ToString(result.status), result.attempts);
    record(std::move(result));
  };

  std::vector<std::unique_ptr<FileWorker>> pool;
  pool.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    std::shared_ptr<DocumentSource> source = sources_();
    pool.push_back(std::make_unique<FileWorker>(queue, [source, &handle](const FileTask& task) { handle(*source, task); }, fail));
  }
  for (auto& w : pool) w->Start();
  for (auto& w : pool) w->Join();
  pool.clear();

  const bool all_failed = !batch.files.empty() && std::all_of(batch.files.begin(), batch.files.end(), [](const FileResult& f) { return f.status == FileStatus::Error; });
  const auto status     = all_failed ? db::model::RunStatus::Failed : db::model::RunStatus::Completed;

  batch.run = ledger.Seal(guid, status);
  observability::Metrics::Instance().RecordRun(db::model::ToString(status),
                                               static_cast<double>(std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start).count()));
  if (!ledger_error.empty()) {
    span.RecordException(ledger_error);
    throw std::runtime_error("run " + guid + " counters incomplete: " + ledger_error);
  }
  return batch;
}

} // namespace ticketflow::processing
