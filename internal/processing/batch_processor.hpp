#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/normalize/synonym_normalizer.hpp"
#include "internal/processing/document_source.hpp"
#include "internal/processing/ticket_processor.hpp"
#include "internal/templates/vendor_template.hpp"

namespace ticketflow::processing {

struct BatchOptions {
  std::size_t               workers            = 0; // 0 => hardware concurrency
  int                       max_retries        = 2;
  std::chrono::milliseconds initial_backoff{500};
  double                    backoff_multiplier = 2.0;
  bool                      check_duplicate_files = true;
  bool                      preload_references    = true;
  std::string               processed_by;
};

enum class FileStatus { Completed, AlreadyProcessed, Error, Skipped, Cancelled };

std::string_view ToString(FileStatus status);

struct FileResult {
  std::string          file_id;
  std::string          file_hash;
  FileStatus           status   = FileStatus::Skipped;
  int                  attempts = 0;
  int                  pages    = 0;
  std::vector<int64_t> ticket_ids;
  std::vector<int64_t> review_ids;
  std::string          error;
  std::chrono::milliseconds duration{0};
};

// Running totals, delivered after each file.
struct BatchProgress {
  std::size_t files_done  = 0;
  std::size_t files_total = 0;
  uint64_t    pages_count  = 0;
  uint64_t    ok_count     = 0; // committed tickets
  uint64_t    error_count  = 0; // files in ERROR
  uint64_t    review_count = 0; // review entries
  const FileResult* last = nullptr;
};

using ProgressCallback = std::function<void(const BatchProgress&)>;

struct BatchResult {
  db::model::ProcessingRun run;
  std::vector<FileResult>  files; // completion order
};

/*
  Runs the per-page pipeline over many files on a fixed worker pool.

  - One file per worker at a time, pages in physical order.
  - util::TransientError retries the whole file (max_retries, exponential
    backoff). Before each retry and after the last failure the file's
    partial results for this run are rolled back; other files are never
    touched.
  - Cancel(): queued files become SKIPPED; a file in flight finishes its
    current page, its partial results are rolled back, and it is
    CANCELLED.
  - A file whose SHA-256 is in the processed-file ledger short-circuits
    to ALREADY_PROCESSED with the originally produced ids.
  - The ProcessingRun is sealed FAILED when every file ended in ERROR,
    COMPLETED otherwise.
*/
class BatchProcessor {
 public:
  BatchProcessor(std::shared_ptr<db::Repository> repository, std::shared_ptr<const templates::TemplateCatalog> catalog,
                 std::shared_ptr<const normalize::SynonymNormalizer> normalizer, ProcessorSettings settings, DocumentSourceFactory sources,
                 BatchOptions options);

  BatchResult Run(const std::vector<std::string>& files, const ProgressCallback& progress = {});

  // Safe from any thread, including the progress callback. Sticky: later runs see it too.
  void Cancel();

  bool Cancelled() const {
    return cancelled_.load();
  }

 private:
  FileResult ProcessFile(TicketProcessor& processor, DocumentSource& source, const std::string& path, const std::string& request_guid);
  void       Attempt(TicketProcessor& processor, DocumentSource& source, FileContext& context, const std::string& path, FileResult& result);
  bool       Rollback(const std::string& file_id, const std::string& request_guid);

  // false when cancelled while waiting
  bool Backoff(std::chrono::milliseconds delay);

  std::shared_ptr<db::Repository>                     repository_;
  std::shared_ptr<const templates::TemplateCatalog>   catalog_;
  std::shared_ptr<const normalize::SynonymNormalizer> normalizer_;
  ProcessorSettings                                   settings_;
  DocumentSourceFactory                               sources_;
  BatchOptions                                        options_;

  std::atomic<bool>       cancelled_{false};
  std::mutex              cancel_mutex_;
  std::condition_variable cancel_cv_;
};

} // namespace ticketflow::processing
