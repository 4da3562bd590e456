#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/codes.hpp"
#include "internal/db/model/truck_ticket.hpp"
#include "internal/util/time.hpp"

namespace ticketflow::db::model {

struct Problem {
  ReviewReason reason   = ReviewReason::MissingTicketNumber;
  Severity     severity = Severity::Critical;
  std::string  field;
  std::string  message;

  // non-blocking problems are recorded but do not hold the ticket back
  bool blocking = true;
};

struct SuggestedFix {
  std::string                        action;
  std::map<std::string, std::string> details;
};

/*
  One entry per page that could not be committed cleanly.

  reason is the most severe problem (first one wins on a tie); problems
  keeps the full list. A provisional ticket is attached whenever enough
  was extracted to build one.
*/
struct ReviewQueueEntry {
  int64_t id = 0;

  std::string page_id;  // "<file_id>#page<n>"
  std::string file_id;
  int         file_page = 0;
  std::string request_guid;

  ReviewReason         reason   = ReviewReason::MissingTicketNumber;
  Severity             severity = Severity::Critical;
  std::vector<Problem> problems;

  std::map<std::string, std::string> detected_fields;
  SuggestedFix                       suggested_fix;
  std::optional<TruckTicket>         provisional_ticket;

  bool                           resolved = false;
  std::string                    resolved_by;
  std::optional<util::TimePoint> resolved_at;

  util::TimePoint created_at{};
};

} // namespace ticketflow::db::model
