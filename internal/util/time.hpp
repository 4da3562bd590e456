#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ticketflow::util {

/*
  Time utilities: single place to control clock source and calendar math.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Date      = std::chrono::year_month_day;

TimePoint Now();
Date      Today();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

std::string FormatTimestamp(TimePoint tp);

// Strict YYYY-MM-DD. Returns nullopt for malformed or impossible dates.
std::optional<Date> ParseIsoDate(std::string_view text);
std::string         FormatDate(const Date& date);

Date    AddDays(const Date& date, int days);
int     DaysBetween(const Date& from, const Date& to);
int64_t ToEpochDays(const Date& date);
Date    FromEpochDays(int64_t days);

} // namespace ticketflow::util
