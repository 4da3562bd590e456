#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace ticketflow::review {

/*
  Operator-facing side of the review queue.

  Resolve marks an entry done. With a corrected ticket it first re-runs
  the manifest rule and commits the ticket in the same transaction; a
  correction that still violates the rule is refused with
  util::InvalidState and the entry stays open.
*/
class ReviewQueue {
 public:
  explicit ReviewQueue(std::shared_ptr<db::Repository> repository);

  std::vector<db::model::ReviewQueueEntry> ListOpen();
  std::vector<db::model::ReviewQueueEntry> ListAll();

  std::optional<db::model::ReviewQueueEntry> Get(int64_t entry_id);

  // Returns the committed ticket id when a correction was supplied.
  std::optional<int64_t> Resolve(int64_t entry_id, const std::string& resolved_by, std::optional<db::model::TruckTicket> corrected = std::nullopt);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace ticketflow::review
