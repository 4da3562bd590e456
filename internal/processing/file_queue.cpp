#include "file_queue.hpp"

namespace ticketflow::processing {

void FileQueue::Enqueue(FileTask task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<FileTask> FileQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  FileTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void FileQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace ticketflow::processing
