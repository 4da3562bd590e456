#include "field_parsers.hpp"

#include <boost/regex.hpp>

#include <array>
#include <cctype>

#include "internal/util/text.hpp"

namespace ticketflow::extract {
namespace {

const boost::regex kIsoDate(R"((?<!\d)(\d{4})-(\d{1,2})-(\d{1,2})(?!\d))");
const boost::regex kUsDate4(R"((?<!\d)(\d{1,2})[/-](\d{1,2})[/-](\d{4})(?!\d))");
const boost::regex kUsDate2(R"((?<!\d)(\d{1,2})/(\d{1,2})/(\d{2})(?!\d))");
const boost::regex kNamedMonth(R"((?<!\d)(\d{1,2})-([A-Za-z]{3,9})-(\d{4})(?!\d))");

const boost::regex kQuantity(R"((\d+(?:[.,]\d+)?)\s*(TONS?|TN|CUBIC\s+YARDS?|CU\.?\s*YDS?|CY|YDS?|LOADS?)?)", boost::regex::perl | boost::regex::icase);

constexpr std::array<std::string_view, 12> kMonths = {"january", "february", "march",     "april",   "may",      "june",
                                                      "july",    "august",   "september", "october", "november", "december"};

std::optional<util::Date> MakeDate(int y, int m, int d) {
  util::Date date{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)}, std::chrono::day{static_cast<unsigned>(d)}};
  if (!date.ok()) return std::nullopt;
  return date;
}

std::optional<int> MonthFromName(const std::string& name) {
  const auto lower = util::ToLower(name);
  for (std::size_t i = 0; i < kMonths.size(); ++i) {
    const auto& full = kMonths[i];
    if (lower == full || (lower.size() == 3 && full.substr(0, 3) == lower)) return static_cast<int>(i) + 1;
    // "Sept"
    if (lower == "sept" && i == 8) return 9;
  }
  return std::nullopt;
}

} // namespace

std::optional<util::Date> ParseTicketDate(std::string_view raw) {
  const std::string text(raw);
  boost::smatch     m;

  if (boost::regex_search(text, m, kIsoDate)) return MakeDate(std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str()));
  if (boost::regex_search(text, m, kUsDate4)) return MakeDate(std::stoi(m[3].str()), std::stoi(m[1].str()), std::stoi(m[2].str()));
  if (boost::regex_search(text, m, kUsDate2)) return MakeDate(2000 + std::stoi(m[3].str()), std::stoi(m[1].str()), std::stoi(m[2].str()));
  if (boost::regex_search(text, m, kNamedMonth)) {
    auto month = MonthFromName(m[2].str());
    if (!month) return std::nullopt;
    return MakeDate(std::stoi(m[3].str()), *month, std::stoi(m[1].str()));
  }
  return std::nullopt;
}

std::optional<Quantity> ParseQuantity(std::string_view raw, db::model::QuantityUnit default_unit) {
  const std::string text(raw);
  boost::smatch     m;
  if (!boost::regex_search(text, m, kQuantity)) return std::nullopt;

  std::string number = m[1].str();
  for (auto& c : number)
    if (c == ',') c = '.';

  Quantity q;
  try {
    q.value = std::stod(number);
  } catch (const std::exception&) {
    return std::nullopt;
  }

  const auto dot = number.find('.');
  q.decimals     = dot == std::string::npos ? 0 : static_cast<int>(number.size() - dot - 1);

  q.unit = default_unit;
  if (m[2].matched) {
    const auto unit = util::ToUpper(m[2].str());
    if (unit.rfind("TON", 0) == 0 || unit == "TN")
      q.unit = db::model::QuantityUnit::Tons;
    else if (unit.rfind("LOAD", 0) == 0)
      q.unit = db::model::QuantityUnit::Loads;
    else
      q.unit = db::model::QuantityUnit::CubicYards;
  }
  return q;
}

bool LooksLikeDate(std::string_view candidate) {
  if (candidate.size() != 8) return false;
  for (char c : candidate)
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  if (candidate.substr(0, 2) != "20") return false;

  const int y = std::stoi(std::string(candidate.substr(0, 4)));
  const int m = std::stoi(std::string(candidate.substr(4, 2)));
  const int d = std::stoi(std::string(candidate.substr(6, 2)));
  return MakeDate(y, m, d).has_value();
}

std::optional<std::string> CleanTicketNumber(std::string_view raw) {
  std::string out;
  for (char c : raw) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '-') out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  if (out.empty() || LooksLikeDate(out)) return std::nullopt;
  return out;
}

std::optional<std::string> CleanIdentifier(std::string_view raw) {
  std::string out;
  for (char c : util::Trim(raw)) {
    if (!std::isspace(static_cast<unsigned char>(c))) out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  if (out.empty()) return std::nullopt;
  return out;
}

} // namespace ticketflow::extract
