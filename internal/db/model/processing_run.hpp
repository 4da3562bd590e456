#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/codes.hpp"
#include "internal/util/time.hpp"

namespace ticketflow::db::model {

struct ProcessingRun {
  std::string request_guid;
  std::string processed_by;

  util::TimePoint                started_at{};
  std::optional<util::TimePoint> completed_at;

  uint64_t files_count   = 0;
  uint64_t pages_count   = 0;
  uint64_t ok_count      = 0;
  uint64_t error_count   = 0;
  uint64_t review_count  = 0;
  uint64_t skipped_count = 0;

  RunStatus status = RunStatus::InProgress;
};

} // namespace ticketflow::db::model
