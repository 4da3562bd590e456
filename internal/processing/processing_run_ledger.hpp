#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace ticketflow::processing {

// Counter increments; applied atomically.
struct RunDelta {
  uint64_t files   = 0;
  uint64_t pages   = 0;
  uint64_t ok      = 0;
  uint64_t errors  = 0;
  uint64_t reviews = 0;
  uint64_t skipped = 0;
};

/*
  Audit ledger of batch invocations. A run is IN_PROGRESS from Start
  until Seal; counters only grow in between. Updating or sealing a
  sealed run throws util::InvalidState.
*/
class ProcessingRunLedger {
 public:
  explicit ProcessingRunLedger(std::shared_ptr<db::Repository> repository);

  // Empty request_guid => a fresh one is generated.
  db::model::ProcessingRun Start(const std::string& processed_by, std::string request_guid = {});

  db::model::ProcessingRun RecordProgress(const std::string& request_guid, const RunDelta& delta);

  // status must be COMPLETED or FAILED.
  db::model::ProcessingRun Seal(const std::string& request_guid, db::model::RunStatus status);

  std::optional<db::model::ProcessingRun> Get(const std::string& request_guid);
  std::vector<db::model::ProcessingRun>   ListRecent(std::size_t limit);

 private:
  db::model::ProcessingRun LoadOpen(db::Transaction& tx, const std::string& request_guid);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace ticketflow::processing
