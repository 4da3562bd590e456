#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/db/model/codes.hpp"
#include "internal/util/time.hpp"

namespace ticketflow::extract {

/*
  Turns raw extracted strings into typed values. All functions are total:
  unparseable input yields nullopt.
*/

// Accepts m/d/Y, m-d-Y, Y-m-d, m/d/y, d-Mon-Y and d-Month-Y, anywhere in raw.
std::optional<util::Date> ParseTicketDate(std::string_view raw);

struct Quantity {
  double                 value    = 0.0;
  db::model::QuantityUnit unit    = db::model::QuantityUnit::Tons;
  int                    decimals = 0; // digits after the decimal point as written
};

// "18.50 TONS", "12 CY", "1 LOAD", "14.2". A bare number takes default_unit.
std::optional<Quantity> ParseQuantity(std::string_view raw, db::model::QuantityUnit default_unit = db::model::QuantityUnit::Tons);

// 8 digits reading as a real 20YYMMDD date.
bool LooksLikeDate(std::string_view candidate);

// Keeps letters, digits and hyphens, uppercased. Rejects empty and date-like values.
std::optional<std::string> CleanTicketNumber(std::string_view raw);

// Trims and uppercases, drops internal whitespace. Empty => nullopt.
std::optional<std::string> CleanIdentifier(std::string_view raw);

} // namespace ticketflow::extract
