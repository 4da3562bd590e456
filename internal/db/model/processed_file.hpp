#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace ticketflow::db::model {

// Ledger row: a whole file that finished processing.
struct ProcessedFileRecord {
  std::string          file_hash;
  std::string          file_id;
  std::string          request_guid;
  util::TimePoint      processed_at{};
  std::vector<int64_t> ticket_ids;
  std::vector<int64_t> review_ids;
};

} // namespace ticketflow::db::model
