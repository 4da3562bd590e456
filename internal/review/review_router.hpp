#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/review_entry.hpp"
#include "internal/db/model/truck_ticket.hpp"
#include "internal/ocr/ocr_page.hpp"

namespace ticketflow::review {

struct RoutingDecision {
  bool commit = false;

  // set when !commit
  std::optional<db::model::ReviewQueueEntry> entry;

  // problems that travel with a committed ticket (INFO, non-blocking WARNING)
  std::vector<db::model::Problem> audit;
};

/*
  Turns the problems accumulated for one page into a decision.

  A page commits when it has a provisional ticket and no blocking
  CRITICAL/WARNING problem. Otherwise one entry aggregates every
  problem: severity is the maximum, reason the first problem at that
  severity.
*/
class ReviewRouter {
 public:
  static bool IsBlocking(const db::model::Problem& problem);

  RoutingDecision Route(const ocr::PageMetadata& page, const std::string& request_guid, std::vector<db::model::Problem> problems,
                        std::map<std::string, std::string> detected_fields, std::optional<db::model::TruckTicket> provisional) const;

  static db::model::SuggestedFix SuggestFix(const db::model::Problem& primary, const std::optional<db::model::TruckTicket>& provisional);
};

} // namespace ticketflow::review
