#pragma once

#include <string>
#include <string_view>

namespace ticketflow::util {

std::string ToLower(std::string_view s);
std::string ToUpper(std::string_view s);
std::string Trim(std::string_view s);

// Collapses runs of whitespace into a single space and trims the ends.
std::string CollapseWhitespace(std::string_view s);

// Position of needle in haystack ignoring case, or npos.
std::size_t FindIgnoreCase(std::string_view haystack, std::string_view needle);

// Length of the longest run of consecutive ASCII digits.
std::size_t LongestDigitRun(std::string_view s);

} // namespace ticketflow::util
