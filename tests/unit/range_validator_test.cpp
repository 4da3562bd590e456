#include "internal/validate/range_validator.hpp"

#include <cassert>
#include <iostream>

namespace {

using namespace ticketflow;
using db::model::QuantityUnit;
using db::model::ReviewReason;

const util::Date kToday = *util::ParseIsoDate("2024-11-01");

db::model::TruckTicket Ticket(const char* date, std::optional<double> quantity = 18.5, QuantityUnit unit = QuantityUnit::Tons) {
  db::model::TruckTicket t;
  t.ticket_number = "100200";
  t.ticket_date   = *util::ParseIsoDate(date);
  t.quantity      = quantity;
  t.quantity_unit = unit;
  return t;
}

bool Flags(const std::vector<db::model::Problem>& problems, ReviewReason reason) {
  for (const auto& p : problems) {
    if (p.reason == reason) {
      assert(p.severity == db::model::Severity::Warning);
      return true;
    }
  }
  return false;
}

void TestPlausibleTicketPasses() {
  validate::RangeValidator validator;
  assert(validator.Validate(Ticket("2024-10-17"), 1, kToday).empty());
  assert(validator.Validate(Ticket("2024-10-17", std::nullopt), std::nullopt, kToday).empty());
  assert(validator.Validate(Ticket("2024-12-01"), 0, kToday).empty()); // exactly 30 days ahead
}

void TestDateOutOfRange() {
  validate::RangeValidator validator;
  assert(Flags(validator.Validate(Ticket("2019-12-31"), 1, kToday), ReviewReason::OutOfRangeDate));
  assert(Flags(validator.Validate(Ticket("2024-12-02"), 1, kToday), ReviewReason::OutOfRangeDate));
  assert(!Flags(validator.Validate(Ticket("2020-01-01"), 1, kToday), ReviewReason::OutOfRangeDate));
}

void TestUnusualQuantities() {
  validate::RangeValidator validator;
  assert(Flags(validator.Validate(Ticket("2024-10-17", 60.0), 0, kToday), ReviewReason::UnusualQuantity));
  assert(Flags(validator.Validate(Ticket("2024-10-17", 45.0, QuantityUnit::CubicYards), 0, kToday), ReviewReason::UnusualQuantity));
  assert(!Flags(validator.Validate(Ticket("2024-10-17", 45.0, QuantityUnit::Tons), 0, kToday), ReviewReason::UnusualQuantity));
  assert(Flags(validator.Validate(Ticket("2024-10-17", 12.0, QuantityUnit::Loads), 0, kToday), ReviewReason::UnusualQuantity));
  assert(Flags(validator.Validate(Ticket("2024-10-17", 0.0), 0, kToday), ReviewReason::UnusualQuantity));
  assert(Flags(validator.Validate(Ticket("2024-10-17", 18.125), 3, kToday), ReviewReason::UnusualQuantity));
}

void TestCustomLimits() {
  validate::RangeLimits limits;
  limits.max_tons        = 20.0;
  limits.max_future_days = 0;
  validate::RangeValidator validator(limits);

  auto problems = validator.Validate(Ticket("2024-11-02", 25.0), 1, kToday);
  assert(problems.size() == 2);
}

} // namespace

int main() {
  TestPlausibleTicketPasses();
  TestDateOutOfRange();
  TestUnusualQuantities();
  TestCustomLimits();

  std::cout << "ticketflow_unit_range_validator: pass\n";
  return 0;
}
