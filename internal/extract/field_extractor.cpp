#include "field_extractor.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <variant>
#include <vector>

#include "internal/util/text.hpp"

namespace ticketflow::extract {
namespace {

using templates::Pattern;

constexpr double kRoiBase        = 0.95;
constexpr double kLabelRightBase = 0.90;
constexpr double kTextBase       = 0.85;
constexpr double kBelowBase      = 0.75;
constexpr double kFallbackText   = 0.70;

// Lines whose vertical centers are closer than this share a row.
constexpr double kRowTolerance = 0.01;

struct Fragment {
  std::string text;
  double      ocr_confidence = 1.0;
};

struct Candidate {
  std::string value;
  std::size_t order = 0;
  double      ocr_confidence = 1.0;
};

std::vector<const ocr::OcrLine*> ReadingOrder(const ocr::OcrPage& page) {
  std::vector<const ocr::OcrLine*> lines;
  lines.reserve(page.lines.size());
  for (const auto& line : page.lines) lines.push_back(&line);

  std::stable_sort(lines.begin(), lines.end(), [](const ocr::OcrLine* a, const ocr::OcrLine* b) {
    if (std::abs(a->bbox.CenterY() - b->bbox.CenterY()) > kRowTolerance) return a->bbox.CenterY() < b->bbox.CenterY();
    return a->bbox.x_min < b->bbox.x_min;
  });
  return lines;
}

double MeanConfidence(const std::vector<const ocr::OcrWord*>& words) {
  if (words.empty()) return 1.0;
  double sum = 0.0;
  for (const auto* w : words) sum += w->confidence;
  return sum / static_cast<double>(words.size());
}

double MeanConfidence(const ocr::OcrLine& line) {
  std::vector<const ocr::OcrWord*> words;
  for (const auto& w : line.words) words.push_back(&w);
  return MeanConfidence(words);
}

std::string StripLabels(std::string text, const std::vector<std::string>& labels) {
  for (const auto& label : labels) {
    if (label.empty()) continue;
    for (auto pos = util::FindIgnoreCase(text, label); pos != std::string::npos; pos = util::FindIgnoreCase(text, label)) {
      text.erase(pos, label.size());
    }
  }
  return util::CollapseWhitespace(text);
}

// Text of one line restricted to words whose center falls in roi.
std::optional<Fragment> FragmentInRegion(const ocr::OcrLine& line, const ocr::BoundingBox& roi) {
  if (line.words.empty()) {
    if (!roi.ContainsPoint(line.bbox.CenterX(), line.bbox.CenterY())) return std::nullopt;
    return Fragment{line.text, 1.0};
  }

  std::vector<const ocr::OcrWord*> inside;
  for (const auto& w : line.words) {
    if (roi.ContainsPoint(w.bbox.CenterX(), w.bbox.CenterY())) inside.push_back(&w);
  }
  if (inside.empty()) return std::nullopt;

  std::stable_sort(inside.begin(), inside.end(), [](const ocr::OcrWord* a, const ocr::OcrWord* b) { return a->bbox.x_min < b->bbox.x_min; });

  std::string text;
  for (const auto* w : inside) {
    if (!text.empty()) text.push_back(' ');
    text += w->value;
  }
  return Fragment{text, MeanConfidence(inside)};
}

void CollectMatches(const Fragment& fragment, const Pattern& pattern, std::size_t base_order, std::vector<Candidate>& out) {
  auto begin = boost::sregex_iterator(fragment.text.begin(), fragment.text.end(), pattern.regex);
  for (auto it = begin; it != boost::sregex_iterator(); ++it) {
    const auto& m     = *it;
    std::string value = (m.size() > 1 && m[1].matched) ? m[1].str() : m[0].str();
    value             = util::Trim(value);
    if (value.empty()) continue;
    out.push_back(Candidate{std::move(value), base_order + static_cast<std::size_t>(m.position(std::size_t{0})), fragment.ocr_confidence});
  }
}

std::optional<Candidate> Select(std::vector<Candidate> candidates, const std::optional<Pattern>& validation) {
  if (validation) {
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                    [&](const Candidate& c) { return !boost::regex_match(c.value, validation->regex); }),
                     candidates.end());
  }
  if (candidates.empty()) return std::nullopt;

  auto best = std::min_element(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
    const auto da = util::LongestDigitRun(a.value);
    const auto db = util::LongestDigitRun(b.value);
    if (da != db) return da > db;
    return a.order < b.order;
  });
  return *best;
}

// Line-indexed order keeps matches from different lines in reading order.
constexpr std::size_t kLineStride = 1u << 16;

std::vector<Candidate> MatchRegion(const ocr::OcrPage& page, const ocr::BoundingBox& roi, const Pattern& pattern, const std::vector<std::string>& labels) {
  std::vector<Candidate> out;
  const auto             lines = ReadingOrder(page);
  for (std::size_t i = 0; i < lines.size(); ++i) {
    auto fragment = FragmentInRegion(*lines[i], roi);
    if (!fragment) continue;
    fragment->text = StripLabels(fragment->text, labels);
    CollectMatches(*fragment, pattern, i * kLineStride, out);
  }
  return out;
}

struct LabelHit {
  std::size_t line_index = 0;
  std::size_t end        = 0; // offset just past the label in the line text
};

std::optional<LabelHit> FindLabel(const std::vector<const ocr::OcrLine*>& lines, const std::vector<std::string>& labels) {
  for (std::size_t i = 0; i < lines.size(); ++i) {
    std::optional<LabelHit> hit;
    for (const auto& label : labels) {
      if (label.empty()) continue;
      const auto pos = util::FindIgnoreCase(lines[i]->text, label);
      if (pos == std::string::npos) continue;
      if (!hit || pos + label.size() < hit->end) hit = LabelHit{i, pos + label.size()};
    }
    if (hit) return hit;
  }
  return std::nullopt;
}

std::vector<Candidate> MatchLabelRight(const ocr::OcrPage& page, const Pattern& pattern, const std::vector<std::string>& labels) {
  std::vector<Candidate> out;
  const auto             lines = ReadingOrder(page);
  auto                   hit   = FindLabel(lines, labels);
  if (!hit) return out;

  const auto& line = *lines[hit->line_index];
  Fragment    tail{line.text.substr(hit->end), MeanConfidence(line)};
  CollectMatches(tail, pattern, hit->line_index * kLineStride, out);
  if (!out.empty()) return out;

  // value printed as a separate line further right on the same row
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto* other = lines[i];
    if (other == &line) continue;
    if (std::abs(other->bbox.CenterY() - line.bbox.CenterY()) > kRowTolerance * 2) continue;
    if (other->bbox.x_min < line.bbox.x_max - kRowTolerance) continue;
    CollectMatches(Fragment{other->text, MeanConfidence(*other)}, pattern, i * kLineStride, out);
  }
  return out;
}

std::string PageText(const ocr::OcrPage& page) {
  if (!page.text.empty()) return page.text;
  std::string text;
  for (const auto* line : ReadingOrder(page)) {
    if (!text.empty()) text.push_back('\n');
    text += line->text;
  }
  return text;
}

double PageConfidence(const ocr::OcrPage& page) {
  std::vector<const ocr::OcrWord*> words;
  for (const auto& line : page.lines)
    for (const auto& w : line.words) words.push_back(&w);
  return MeanConfidence(words);
}

std::vector<Candidate> MatchText(const ocr::OcrPage& page, const Pattern& pattern) {
  std::vector<Candidate> out;
  CollectMatches(Fragment{PageText(page), PageConfidence(page)}, pattern, 0, out);
  return out;
}

std::vector<Candidate> MatchBelow(const ocr::OcrPage& page, const templates::FieldRule& rule, const Pattern& pattern) {
  const auto lines = ReadingOrder(page);

  if (auto hit = FindLabel(lines, rule.labels)) {
    const auto& label_line = *lines[hit->line_index];

    // nearest row under the label that overlaps it horizontally
    std::optional<double> row_y;
    for (const auto* other : lines) {
      if (other->bbox.y_min < label_line.bbox.y_max - kRowTolerance / 2) continue;
      if (other->bbox.x_max < label_line.bbox.x_min || other->bbox.x_min > label_line.bbox.x_max) continue;
      if (other == &label_line) continue;
      if (!row_y || other->bbox.CenterY() < *row_y) row_y = other->bbox.CenterY();
    }

    std::vector<Candidate> out;
    if (!row_y) return out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
      const auto* other = lines[i];
      if (other == &label_line) continue;
      if (std::abs(other->bbox.CenterY() - *row_y) > kRowTolerance) continue;
      if (other->bbox.x_max < label_line.bbox.x_min || other->bbox.x_min > label_line.bbox.x_max) continue;
      CollectMatches(Fragment{other->text, MeanConfidence(*other)}, pattern, i * kLineStride, out);
    }
    return out;
  }

  if (const auto* roi = std::get_if<templates::RoiRegex>(&rule.method)) {
    const double    height = roi->roi.y_max - roi->roi.y_min;
    ocr::BoundingBox below{roi->roi.x_min, roi->roi.y_max, roi->roi.x_max, std::min(1.0, roi->roi.y_max + height)};
    return MatchRegion(page, below, pattern, rule.labels);
  }
  return {};
}

const Pattern& PrimaryPattern(const templates::ExtractionMethod& method) {
  return std::visit([](const auto& m) -> const Pattern& { return m.pattern; }, method);
}

FieldValue Finish(const std::optional<Candidate>& selected, double base, ExtractionSource source) {
  FieldValue value;
  if (!selected) return value;
  value.raw        = selected->value;
  value.confidence = std::clamp(base * selected->ocr_confidence, 0.0, 1.0);
  value.source     = source;
  return value;
}

} // namespace

std::string_view ToString(ExtractionSource source) {
  switch (source) {
  case ExtractionSource::None:
    return "none";
  case ExtractionSource::Roi:
    return "roi_regex";
  case ExtractionSource::LabelRight:
    return "label_right";
  case ExtractionSource::TextRegex:
    return "text_regex";
  case ExtractionSource::BelowLabel:
    return "below_label";
  case ExtractionSource::FallbackText:
    return "fallback_text_regex";
  }
  return "none";
}

FieldExtractor::FieldExtractor(std::shared_ptr<const templates::TemplateCatalog> catalog) : catalog_(std::move(catalog)) {
}

FieldValue FieldExtractor::Extract(const ocr::OcrPage& page, const std::optional<std::string>& vendor, templates::FieldName field) const {
  const auto* rule = catalog_->RuleFor(vendor, field);
  if (!rule) return {};
  return Apply(page, *rule);
}

FieldValue FieldExtractor::Apply(const ocr::OcrPage& page, const templates::FieldRule& rule) {
  FieldValue primary = std::visit(
      [&](const auto& method) -> FieldValue {
        using M = std::decay_t<decltype(method)>;
        if constexpr (std::is_same_v<M, templates::RoiRegex>) {
          return Finish(Select(MatchRegion(page, method.roi, method.pattern, rule.labels), rule.validation), kRoiBase, ExtractionSource::Roi);
        } else if constexpr (std::is_same_v<M, templates::LabelRight>) {
          return Finish(Select(MatchLabelRight(page, method.pattern, rule.labels), rule.validation), kLabelRightBase, ExtractionSource::LabelRight);
        } else {
          return Finish(Select(MatchText(page, method.pattern), rule.validation), kTextBase, ExtractionSource::TextRegex);
        }
      },
      rule.method);

  if (primary.Found() || !rule.fallback) return primary;

  return std::visit(
      [&](const auto& fallback) -> FieldValue {
        using F = std::decay_t<decltype(fallback)>;
        if constexpr (std::is_same_v<F, templates::BelowLabel>) {
          const Pattern& pattern = fallback.pattern ? *fallback.pattern : PrimaryPattern(rule.method);
          return Finish(Select(MatchBelow(page, rule, pattern), rule.validation), kBelowBase, ExtractionSource::BelowLabel);
        } else {
          return Finish(Select(MatchText(page, fallback.pattern), rule.validation), kFallbackText, ExtractionSource::FallbackText);
        }
      },
      *rule.fallback);
}

} // namespace ticketflow::extract
