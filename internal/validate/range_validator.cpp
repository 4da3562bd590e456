#include "range_validator.hpp"

#include <sstream>

namespace ticketflow::validate {

using db::model::Problem;
using db::model::ReviewReason;
using db::model::Severity;

RangeValidator::RangeValidator(RangeLimits limits) : limits_(limits) {
}

double RangeValidator::MaxFor(db::model::QuantityUnit unit) const {
  switch (unit) {
  case db::model::QuantityUnit::Tons:
    return limits_.max_tons;
  case db::model::QuantityUnit::CubicYards:
    return limits_.max_cubic_yards;
  case db::model::QuantityUnit::Loads:
    return limits_.max_loads;
  }
  return limits_.max_tons;
}

std::vector<Problem> RangeValidator::Validate(const db::model::TruckTicket& ticket, std::optional<int> quantity_decimals, const util::Date& today) const {
  std::vector<Problem> problems;

  const auto latest = util::AddDays(today, limits_.max_future_days);
  if (ticket.ticket_date < limits_.min_date || ticket.ticket_date > latest) {
    problems.push_back(Problem{ReviewReason::OutOfRangeDate, Severity::Warning, "ticket_date",
                               "date " + util::FormatDate(ticket.ticket_date) + " outside " + util::FormatDate(limits_.min_date) + " .. " + util::FormatDate(latest)});
  }

  if (ticket.quantity) {
    const double       q   = *ticket.quantity;
    const double       max = MaxFor(ticket.quantity_unit);
    std::ostringstream msg;
    msg << "quantity " << q << " " << db::model::ToString(ticket.quantity_unit);

    if (q <= 0.0) {
      msg << " is not positive";
      problems.push_back(Problem{ReviewReason::UnusualQuantity, Severity::Warning, "quantity", msg.str()});
    } else if (q > max) {
      msg << " exceeds " << max;
      problems.push_back(Problem{ReviewReason::UnusualQuantity, Severity::Warning, "quantity", msg.str()});
    } else if (quantity_decimals && *quantity_decimals > limits_.max_decimals) {
      msg << " has " << *quantity_decimals << " decimal places";
      problems.push_back(Problem{ReviewReason::UnusualQuantity, Severity::Warning, "quantity", msg.str()});
    }
  }
  return problems;
}

} // namespace ticketflow::validate
