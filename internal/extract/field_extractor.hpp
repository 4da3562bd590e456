#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/ocr/ocr_page.hpp"
#include "internal/templates/vendor_template.hpp"

namespace ticketflow::extract {

enum class ExtractionSource { None, Roi, LabelRight, TextRegex, BelowLabel, FallbackText };

std::string_view ToString(ExtractionSource source);

// A miss is an ordinary value: raw == nullopt, confidence == 0.
struct FieldValue {
  std::optional<std::string> raw;
  double                     confidence = 0.0;
  ExtractionSource           source     = ExtractionSource::None;

  bool Found() const {
    return raw.has_value();
  }
};

/*
  Applies the catalog's rule for (vendor, field) to one page.

  Primary method first; the fallback runs only when the primary has no
  match that passes validation_regex. Among several matches the longest
  digit run wins, then reading order (top-to-bottom, left-to-right).
  The value is capture group 1 when the pattern has one, else the whole
  match.

  Confidence = method base (roi .95, label .90, text .85; fallbacks
  below_label .75, text .70) scaled by the mean OCR confidence of the
  words involved.

  Never throws for missing labels or regions.
*/
class FieldExtractor {
 public:
  explicit FieldExtractor(std::shared_ptr<const templates::TemplateCatalog> catalog);

  // vendor nullopt => DEFAULT template.
  FieldValue Extract(const ocr::OcrPage& page, const std::optional<std::string>& vendor, templates::FieldName field) const;

  static FieldValue Apply(const ocr::OcrPage& page, const templates::FieldRule& rule);

 private:
  std::shared_ptr<const templates::TemplateCatalog> catalog_;
};

} // namespace ticketflow::extract
