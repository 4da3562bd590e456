#include "filename_parser.hpp"

#include <boost/regex.hpp>

#include <filesystem>
#include <vector>

#include "internal/util/text.hpp"

namespace ticketflow::processing {
namespace {

const boost::regex kJobCode(R"(^\d{2}-\d{3}$)");

std::vector<std::string> Split(const std::string& stem) {
  std::vector<std::string> parts;
  std::size_t              start = 0;
  while (true) {
    const auto pos = stem.find("__", start);
    parts.push_back(stem.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
    if (pos == std::string::npos) break;
    start = pos + 2;
  }
  return parts;
}

std::optional<std::string> Segment(const std::vector<std::string>& parts, std::size_t i) {
  if (i >= parts.size()) return std::nullopt;
  auto value = util::ToUpper(util::Trim(parts[i]));
  if (value.empty()) return std::nullopt;
  return value;
}

} // namespace

FilenameHints ParseFilename(std::string_view path) {
  FilenameHints hints;

  const auto stem  = std::filesystem::path(std::string(path)).stem().string();
  const auto parts = Split(stem);
  if (parts.size() < 2) return hints;

  const auto job = util::Trim(parts[0]);
  if (!boost::regex_match(job, kJobCode)) return hints;
  hints.job_code = job;

  if (auto date = util::ParseIsoDate(util::Trim(parts[1]))) {
    const int year = static_cast<int>(date->year());
    if (year >= 2020 && year <= 2030) hints.date = *date;
  }

  hints.source_area = Segment(parts, 2);
  hints.ticket_type = Segment(parts, 3);
  hints.material    = Segment(parts, 4);
  hints.vendor      = Segment(parts, 5);
  return hints;
}

} // namespace ticketflow::processing
