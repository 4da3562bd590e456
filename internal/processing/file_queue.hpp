#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace ticketflow::processing {

struct FileTask {
  std::size_t index = 0; // submission position
  std::string path;
};

/*
  Thread-safe blocking queue feeding batch workers.
*/
class FileQueue {
 public:
  void Enqueue(FileTask task);

  // blocking wait; nullopt once shut down and empty
  std::optional<FileTask> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<FileTask>    queue_;
  bool                    shutdown_ = false;
};

} // namespace ticketflow::processing
