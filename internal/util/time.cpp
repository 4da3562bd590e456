#include "time.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace ticketflow::util {

TimePoint Now() {
  return Clock::now();
}

Date Today() {
  return Date{std::chrono::floor<std::chrono::days>(Now())};
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::string FormatTimestamp(TimePoint tp) {
  const auto  seconds = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  const auto  millis  = std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count();
  std::time_t t       = Clock::to_time_t(seconds);
  std::tm     utc{};
  gmtime_r(&t, &utc);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec,
                static_cast<int>(millis));
  return buf;
}

std::optional<Date> ParseIsoDate(std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;

  auto digits = [&](std::size_t pos, std::size_t len) -> std::optional<int> {
    int value = 0;
    for (std::size_t i = pos; i < pos + len; ++i) {
      if (!std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
      value = value * 10 + (text[i] - '0');
    }
    return value;
  };

  auto y = digits(0, 4);
  auto m = digits(5, 2);
  auto d = digits(8, 2);
  if (!y || !m || !d) return std::nullopt;

  Date date{std::chrono::year{*y}, std::chrono::month{static_cast<unsigned>(*m)}, std::chrono::day{static_cast<unsigned>(*d)}};
  if (!date.ok()) return std::nullopt;
  return date;
}

std::string FormatDate(const Date& date) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(date.year()), static_cast<unsigned>(date.month()), static_cast<unsigned>(date.day()));
  return buf;
}

Date AddDays(const Date& date, int days) {
  return Date{std::chrono::sys_days{date} + std::chrono::days{days}};
}

int DaysBetween(const Date& from, const Date& to) {
  return static_cast<int>((std::chrono::sys_days{to} - std::chrono::sys_days{from}).count());
}

int64_t ToEpochDays(const Date& date) {
  return std::chrono::sys_days{date}.time_since_epoch().count();
}

Date FromEpochDays(int64_t days) {
  return Date{std::chrono::sys_days{std::chrono::days{days}}};
}

} // namespace ticketflow::util
