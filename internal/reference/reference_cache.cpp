#include "reference_cache.hpp"

#include <mutex>

#include "internal/util/errors.hpp"

namespace ticketflow::reference {

using db::model::ReferenceCategory;
using db::model::ReferenceEntity;

ReferenceCache::ReferenceCache(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

// ------------------------------------------------------------
// Preload
// ------------------------------------------------------------

void ReferenceCache::Preload() {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListReferences(*tx);
  tx->Commit();
  repository_lookups_++;

  std::unique_lock lock(mutex_);
  entries_.clear();
  for (auto& row : rows) {
    Key key{row.category, row.canonical_name};
    entries_.emplace(std::move(key), std::move(row));
  }
  preloaded_ = true;
}

void ReferenceCache::Invalidate() {
  std::unique_lock lock(mutex_);
  entries_.clear();
  preloaded_ = false;
}

// ------------------------------------------------------------
// Lookup
// ------------------------------------------------------------

std::optional<ReferenceEntity> ReferenceCache::Lookup(ReferenceCategory category, const std::string& canonical_name) {
  {
    std::shared_lock lock(mutex_);
    auto             it = entries_.find(Key{category, canonical_name});
    if (it != entries_.end()) return it->second;
    if (preloaded_) return std::nullopt;
  }

  auto tx  = repository_->Begin();
  auto row = repository_->FindReference(*tx, category, canonical_name);
  tx->Commit();
  repository_lookups_++;

  if (!row) return std::nullopt;

  std::unique_lock lock(mutex_);
  auto [it, inserted] = entries_.try_emplace(Key{category, canonical_name}, *row);
  return it->second;
}

ReferenceEntity ReferenceCache::Resolve(ReferenceCategory category, const std::string& canonical_name) {
  auto entity = Lookup(category, canonical_name);
  if (!entity) {
    throw util::NotFound("unresolved " + std::string(db::model::ToString(category)) + " '" + canonical_name + "'");
  }
  return *entity;
}

std::size_t ReferenceCache::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

} // namespace ticketflow::reference
