#include "memory_tx.hpp"

#include <stdexcept>

namespace ticketflow::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.mutex_) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (finished_) throw std::logic_error("memory transaction already finished");
  if (!working_) working_ = repo_.committed_; // copy on first write
  return *working_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  if (finished_) throw std::logic_error("memory transaction already finished");
  return working_ ? *working_ : repo_.committed_;
}

void MemoryTransaction::Commit() {
  if (finished_) throw std::logic_error("memory transaction already finished");
  if (working_) {
    repo_.committed_ = std::move(*working_);
    working_.reset();
  }
  finished_ = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (finished_) return;
  working_.reset();
  finished_ = true;
  lock_.unlock();
}

} // namespace ticketflow::db::memory
