#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/reference_entity.hpp"

namespace ticketflow::reference {

/*
  Canonical name -> reference entity, scoped to one batch run.

  Lazy mode memoizes each repository hit. Preload() pulls every table
  once; after that a miss is answered from memory without touching the
  repository, since reference data is append-only during a run.

  Thread-safe. Concurrent misses on the same key may each query the
  repository; the first insert wins.

  The cache opens its own repository transactions: never call it while
  holding a transaction on the same thread.
*/
class ReferenceCache {
 public:
  explicit ReferenceCache(std::shared_ptr<db::Repository> repository);

  void Preload();
  void Invalidate();

  std::optional<db::model::ReferenceEntity> Lookup(db::model::ReferenceCategory category, const std::string& canonical_name);

  // Throws util::NotFound naming the category and value.
  db::model::ReferenceEntity Resolve(db::model::ReferenceCategory category, const std::string& canonical_name);

  std::size_t Size() const;

  uint64_t RepositoryLookups() const {
    return repository_lookups_.load();
  }

 private:
  using Key = std::pair<db::model::ReferenceCategory, std::string>;

  std::shared_ptr<db::Repository> repository_;

  mutable std::shared_mutex                   mutex_;
  std::map<Key, db::model::ReferenceEntity>   entries_;
  bool                                        preloaded_ = false;
  std::atomic<uint64_t>                       repository_lookups_{0};
};

} // namespace ticketflow::reference
