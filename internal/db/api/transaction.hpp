#pragma once

namespace ticketflow::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Writers are serialized; at most one open transaction per backend
    may hold the write lock

  SQLite: BEGIN IMMEDIATE
  Memory: exclusive lock + snapshot copy-on-write
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once the transaction is finished (committed or rolled back)
  virtual bool IsCommitted() const = 0;
};

} // namespace ticketflow::db
