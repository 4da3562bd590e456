#pragma once

#include <optional>
#include <vector>

#include "internal/db/model/review_entry.hpp"
#include "internal/db/model/truck_ticket.hpp"
#include "internal/util/time.hpp"

namespace ticketflow::validate {

struct RangeLimits {
  util::Date min_date{std::chrono::year{2020}, std::chrono::January, std::chrono::day{1}};
  int        max_future_days = 30;
  double     max_tons        = 50.0;
  double     max_cubic_yards = 40.0;
  double     max_loads       = 10.0;
  int        max_decimals    = 2;
};

// Plausibility of date and quantity. WARNING problems only.
class RangeValidator {
 public:
  explicit RangeValidator(RangeLimits limits = {});

  std::vector<db::model::Problem> Validate(const db::model::TruckTicket& ticket, std::optional<int> quantity_decimals, const util::Date& today) const;

  const RangeLimits& Limits() const {
    return limits_;
  }

 private:
  double MaxFor(db::model::QuantityUnit unit) const;

  RangeLimits limits_;
};

} // namespace ticketflow::validate
