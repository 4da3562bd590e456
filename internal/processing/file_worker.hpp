#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "file_queue.hpp"

namespace ticketflow::processing {

/*
  Pool thread: pulls files off the queue until it is shut down and
  drained. Anything escaping the handler is logged and passed to
  on_failure with the task, then the worker moves on.
*/
class FileWorker {
 public:
  using Handler        = std::function<void(const FileTask&)>;
  using FailureHandler = std::function<void(const FileTask&, const std::string& error)>;

  FileWorker(std::shared_ptr<FileQueue> queue, Handler handler, FailureHandler on_failure = {});
  ~FileWorker();

  FileWorker(const FileWorker&)            = delete;
  FileWorker& operator=(const FileWorker&) = delete;

  void Start();

  // Waits for the queue to drain; call after FileQueue::Shutdown().
  void Join();

 private:
  void Run();
  void Fail(const FileTask& task, const std::string& error);

  std::shared_ptr<FileQueue> queue_;
  Handler                    handler_;
  FailureHandler             on_failure_;
  std::thread                thread_;
};

} // namespace ticketflow::processing
