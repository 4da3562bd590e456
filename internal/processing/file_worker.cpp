#include "file_worker.hpp"

#include "internal/observability/logging.hpp"

namespace ticketflow::processing {

FileWorker::FileWorker(std::shared_ptr<FileQueue> queue, Handler handler, FailureHandler on_failure)
    : queue_(std::move(queue)), handler_(std::move(handler)), on_failure_(std::move(on_failure)) {
}

FileWorker::~FileWorker() {
  if (thread_.joinable()) {
    queue_->Shutdown();
    thread_.join();
  }
}

void FileWorker::Start() {
  thread_ = std::thread(&FileWorker::Run, this);
}

void FileWorker::Join() {
  if (thread_.joinable()) thread_.join();
}

void FileWorker::Run() {
  while (true) {
    auto task = queue_->Dequeue();
    if (!task) break;

    try {
      handler_(*task);
    } catch (const std::exception& e) {
      Fail(*task, e.what());
    } catch (...) {
      Fail(*task, "unknown exception");
    }
  }
}

void FileWorker::Fail(const FileTask& task, const std::string& error) {
  TICKETFLOW_LOG_ERROR("file worker: unhandled failure", {observability::StringField("file", task.path), observability::StringField("error", error)});
  if (!on_failure_) return;
  try {
    on_failure_(task, error);
  } catch (const std::exception& e) {
    TICKETFLOW_LOG_ERROR("file worker: failure handler threw", {observability::StringField("file", task.path), observability::StringField("error", e.what())});
  }
}

} // namespace ticketflow::processing
