#pragma once

#include <mutex>
#include <optional>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace ticketflow::db::memory {

/*
  Transaction = exclusive lock + lazily copied write set.

  The repository mutex is held from construction until Commit/Rollback,
  which serializes transactions the way BEGIN IMMEDIATE does for sqlite.
  Do not open a second transaction on the same thread while one is live.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return finished_;
  }

  MemoryRepository::State&       Mutable();
  const MemoryRepository::State& View() const;

 private:
  MemoryRepository&                      repo_;
  std::unique_lock<std::mutex>           lock_;
  std::optional<MemoryRepository::State> working_;
  bool                                   finished_ = false;
};

} // namespace ticketflow::db::memory
