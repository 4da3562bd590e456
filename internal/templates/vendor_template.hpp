#pragma once

#include <boost/regex.hpp>
#include <opencv2/core.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/ocr/ocr_page.hpp"

namespace ticketflow::templates {

enum class FieldName { TicketNumber, TicketDate, Quantity, ManifestNumber, TruckNumber, Material, Source, Destination };

std::string_view         ToString(FieldName field);
std::optional<FieldName> ParseFieldName(std::string_view text);

// Compiled once at load; the source text is kept for diagnostics.
struct Pattern {
  std::string  source;
  boost::regex regex;
};

// ------------------------------------------------------------
// Extraction methods (closed set)
// ------------------------------------------------------------

struct RoiRegex {
  ocr::BoundingBox roi;
  Pattern          pattern;
};

struct LabelRight {
  Pattern pattern;
};

struct TextRegex {
  Pattern pattern;
};

using ExtractionMethod = std::variant<RoiRegex, LabelRight, TextRegex>;

// Text just below the label line, or just below the primary ROI when no
// label is declared. Without its own pattern the primary one is reused.
struct BelowLabel {
  std::optional<Pattern> pattern;
};

using FallbackMethod = std::variant<BelowLabel, TextRegex>;

struct FieldRule {
  FieldName                     field = FieldName::TicketNumber;
  ExtractionMethod              method;
  std::vector<std::string>      labels; // synonyms, OR-matched
  std::optional<Pattern>        validation;
  std::optional<FallbackMethod> fallback;
};

struct LogoTemplate {
  std::string      ref;
  cv::Mat          image; // CV_8UC1
  ocr::BoundingBox roi{0.0, 0.0, 1.0, 1.0};
  double           threshold = 0.85;
};

struct VendorTemplate {
  std::string                    vendor_name;
  std::vector<std::string>       aliases;
  std::vector<std::string>       match_terms;
  std::vector<std::string>       exclude_terms;
  std::optional<LogoTemplate>    logo;
  std::map<FieldName, FieldRule> fields;

  const FieldRule* Rule(FieldName field) const {
    auto it = fields.find(field);
    return it == fields.end() ? nullptr : &it->second;
  }
};

inline constexpr std::string_view kDefaultTemplateName = "DEFAULT";

/*
  Immutable set of vendor templates plus the DEFAULT template used when
  the vendor is unknown or a vendor template omits a field.
*/
class TemplateCatalog {
 public:
  TemplateCatalog(std::vector<VendorTemplate> vendors, VendorTemplate default_template);

  const std::vector<VendorTemplate>& Vendors() const {
    return vendors_;
  }
  const VendorTemplate& Default() const {
    return default_;
  }

  const VendorTemplate* Find(std::string_view vendor_name) const;

  // Vendor's own rule first, then DEFAULT's. nullptr if neither has one.
  const FieldRule* RuleFor(const std::optional<std::string>& vendor_name, FieldName field) const;

 private:
  std::vector<VendorTemplate> vendors_;
  VendorTemplate              default_;
};

} // namespace ticketflow::templates
