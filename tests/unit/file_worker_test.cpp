#include "internal/processing/file_worker.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using ticketflow::processing::FileQueue;
using ticketflow::processing::FileTask;
using ticketflow::processing::FileWorker;

struct NotAnException {
  int code = 7;
};

std::shared_ptr<FileQueue> Queue(const std::vector<std::string>& paths) {
  auto queue = std::make_shared<FileQueue>();
  for (std::size_t i = 0; i < paths.size(); ++i) queue->Enqueue(FileTask{i, paths[i]});
  queue->Shutdown();
  return queue;
}

void TestHandlerFailureIsReportedAndWorkerContinues() {
  auto queue = Queue({"a.pdf", "bad.pdf", "weird.pdf", "c.pdf"});

  std::mutex                                       mutex;
  std::set<std::string>                            handled;
  std::vector<std::pair<std::string, std::string>> failed;

  FileWorker worker(
      queue,
      [&](const FileTask& task) {
        if (task.path == "bad.pdf") throw std::runtime_error("corrupt page tree");
        if (task.path == "weird.pdf") throw NotAnException{};
        std::lock_guard lock(mutex);
        handled.insert(task.path);
      },
      [&](const FileTask& task, const std::string& error) {
        std::lock_guard lock(mutex);
        failed.emplace_back(task.path, error);
      });
  worker.Start();
  worker.Join();

  assert((handled == std::set<std::string>{"a.pdf", "c.pdf"}));
  assert(failed.size() == 2);
  assert(failed[0].first == "bad.pdf");
  assert(failed[0].second == "corrupt page tree");
  assert(failed[1].first == "weird.pdf");
  assert(failed[1].second == "unknown exception");
}

void TestThrowingFailureHandlerDoesNotStopWorker() {
  auto queue = Queue({"bad.pdf", "next.pdf"});

  std::vector<std::string> handled;
  FileWorker               worker(
      queue,
      [&](const FileTask& task) {
        if (task.path == "bad.pdf") throw std::runtime_error("boom");
        handled.push_back(task.path);
      },
      [](const FileTask&, const std::string&) { throw std::runtime_error("ledger offline"); });
  worker.Start();
  worker.Join();

  assert(handled == std::vector<std::string>{"next.pdf"});
}

void TestNoFailureHandler() {
  auto queue = Queue({"bad.pdf", "next.pdf"});

  std::vector<std::string> handled;
  FileWorker               worker(queue, [&](const FileTask& task) {
    if (task.path == "bad.pdf") throw std::runtime_error("boom");
    handled.push_back(task.path);
  });
  worker.Start();
  worker.Join();

  assert(handled == std::vector<std::string>{"next.pdf"});
}

} // namespace

int main() {
  TestHandlerFailureIsReportedAndWorkerContinues();
  TestThrowingFailureHandlerDoesNotStopWorker();
  TestNoFailureHandler();

  std::cout << "ticketflow_unit_file_worker: pass" << std::endl;
  return 0;
}
