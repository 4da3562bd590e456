#include "internal/extract/field_parsers.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

namespace {

using ticketflow::db::model::QuantityUnit;
using namespace ticketflow::extract;
using namespace std::chrono;

ticketflow::util::Date D(int y, unsigned m, unsigned d) {
  return year_month_day{year{y}, month{m}, day{d}};
}

void TestDateFormats() {
  assert(ParseTicketDate("10/17/2024") == D(2024, 10, 17));
  assert(ParseTicketDate("10-17-2024") == D(2024, 10, 17));
  assert(ParseTicketDate("2024-10-17") == D(2024, 10, 17));
  assert(ParseTicketDate("10/17/24") == D(2024, 10, 17));
  assert(ParseTicketDate("17-Oct-2024") == D(2024, 10, 17));
  assert(ParseTicketDate("17-October-2024") == D(2024, 10, 17));
  assert(ParseTicketDate("Date: 1/5/2025 07:42") == D(2025, 1, 5));
}

void TestImpossibleDatesAreRejected() {
  assert(!ParseTicketDate("02/30/2024"));
  assert(!ParseTicketDate("13/01/2024"));
  assert(!ParseTicketDate("17-Foo-2024"));
  assert(!ParseTicketDate("no date here"));
  assert(!ParseTicketDate(""));
}

void TestQuantityUnits() {
  auto tons = ParseQuantity("18.50 TONS");
  assert(tons && std::abs(tons->value - 18.5) < 1e-9 && tons->unit == QuantityUnit::Tons && tons->decimals == 2);

  auto cy = ParseQuantity("12 CY");
  assert(cy && cy->value == 12.0 && cy->unit == QuantityUnit::CubicYards && cy->decimals == 0);

  auto yards = ParseQuantity("14 cubic yards");
  assert(yards && yards->unit == QuantityUnit::CubicYards);

  auto loads = ParseQuantity("1 Load");
  assert(loads && loads->unit == QuantityUnit::Loads);

  auto bare = ParseQuantity("7.125", QuantityUnit::Loads);
  assert(bare && bare->unit == QuantityUnit::Loads && bare->decimals == 3);

  assert(!ParseQuantity("n/a"));
}

void TestDateLikeTicketNumbersAreRejected() {
  assert(LooksLikeDate("20241017"));
  assert(!LooksLikeDate("20241399"));
  assert(!LooksLikeDate("12345678"));
  assert(!CleanTicketNumber("20241017"));
  assert(CleanTicketNumber(" 12345678 ") == std::optional<std::string>("12345678"));
  assert(CleanTicketNumber("tk-00123") == std::optional<std::string>("TK-00123"));
  assert(!CleanTicketNumber("  "));
}

void TestIdentifierCleanup() {
  assert(CleanIdentifier(" mf 123456 ") == std::optional<std::string>("MF123456"));
  assert(!CleanIdentifier("   "));
}

} // namespace

int main() {
  TestDateFormats();
  TestImpossibleDatesAreRejected();
  TestQuantityUnits();
  TestDateLikeTicketNumbersAreRejected();
  TestIdentifierCleanup();

  std::cout << "ticketflow_unit_field_parsers: pass\n";
  return 0;
}
