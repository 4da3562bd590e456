#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/processing/batch_processor.hpp"
#include "internal/util/time.hpp"

namespace {

volatile std::sig_atomic_t g_stop = 0;

void HandleSignal(int) {
  g_stop = 1;
}

void Usage() {
  std::cerr << "Usage: ticketflow --config <config.yaml> [--processed-by NAME] <file>..." << std::endl;
}

} // namespace

int main(int argc, char** argv) {
  std::string              config_path;
  std::string              processed_by;
  std::vector<std::string> files;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--processed-by" && i + 1 < argc) {
      processed_by = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      Usage();
      return 0;
    } else if (!arg.empty() && arg[0] == '-') {
      Usage();
      return 2;
    } else {
      files.push_back(arg);
    }
  }

  if (config_path.empty() || files.empty()) {
    Usage();
    return 2;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = ticketflow::config::ConfigLoader::LoadFromYaml(config_path);
    if (!processed_by.empty()) config.mutable_batch()->set_processed_by(processed_by);

    ticketflow::observability::InitializeLogging(config);
    ticketflow::observability::InitializeTracing(config);
    ticketflow::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build pipeline (dependency graph)
    // ------------------------------------------------------------
    auto pipeline = ticketflow::factory::Build(config);
    auto batch    = ticketflow::factory::BuildBatchProcessor(pipeline);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::atomic<bool> done{false};
    std::thread       watcher([&] {
      while (!done) {
        if (g_stop) {
          TICKETFLOW_LOG_WARN("cancellation requested");
          batch->Cancel();
          return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
      }
    });

    auto report = [](const ticketflow::processing::BatchProgress& progress) {
      std::cerr << "[" << progress.files_done << "/" << progress.files_total << "] ok=" << progress.ok_count << " review=" << progress.review_count
                << " error=" << progress.error_count << std::endl;
    };

    ticketflow::processing::BatchResult result;
    try {
      result = batch->Run(files, report);
    } catch (...) {
      done = true;
      watcher.join();
      throw;
    }
    done = true;
    watcher.join();
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    const auto& run = result.run;
    std::cout << "run " << run.request_guid << " " << ticketflow::db::model::ToString(run.status) << "\n"
              << "  started: " << ticketflow::util::FormatTimestamp(run.started_at) << "\n";
    if (run.completed_at) std::cout << "  sealed:  " << ticketflow::util::FormatTimestamp(*run.completed_at) << "\n";
    std::cout << "  files:   " << run.files_count << "\n"
              << "  pages:   " << run.pages_count << "\n"
              << "  ok:      " << run.ok_count << "\n"
              << "  review:  " << run.review_count << "\n"
              << "  errors:  " << run.error_count << "\n"
              << "  skipped: " << run.skipped_count << std::endl;

    for (const auto& file : result.files) {
      std::cout << "  " << ticketflow::processing::ToString(file.status) << " " << file.file_id;
      if (!file.error.empty()) std::cout << " (" << file.error << ")";
      std::cout << "\n";
    }

    ticketflow::observability::ShutdownMetrics();
    ticketflow::observability::ShutdownTracing();
    ticketflow::observability::ShutdownLogging();
    return run.status == ticketflow::db::model::RunStatus::Completed ? 0 : 1;
  } catch (const std::exception& e) {
    TICKETFLOW_LOG_ERROR("Fatal error", {ticketflow::observability::StringField("error", e.what())});
    ticketflow::observability::ShutdownMetrics();
    ticketflow::observability::ShutdownTracing();
    ticketflow::observability::ShutdownLogging();
    return 2;
  }
}
