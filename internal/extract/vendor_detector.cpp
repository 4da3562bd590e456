#include "vendor_detector.hpp"

#include <algorithm>
#include <map>
#include <set>

#include "internal/extract/logo_matcher.hpp"
#include "internal/util/text.hpp"

namespace ticketflow::extract {
namespace {

constexpr double kAmbiguousConfidence = 0.5;

double KeywordConfidence(std::size_t term_matches) {
  if (term_matches >= 3) return 0.95;
  if (term_matches == 2) return 0.90;
  return 0.85;
}

} // namespace

VendorDetector::VendorDetector(std::shared_ptr<const templates::TemplateCatalog> catalog, double min_confidence)
    : catalog_(std::move(catalog)), min_confidence_(min_confidence) {
}

std::vector<VendorCandidate> VendorDetector::Candidates(const std::string& text, const cv::Mat& image) const {
  const auto lower = util::ToLower(text);

  std::map<std::string, VendorCandidate> by_vendor;

  for (const auto& vendor : catalog_->Vendors()) {
    // logo
    if (vendor.logo && !image.empty()) {
      const double score = MatchLogo(image, vendor.logo->image, vendor.logo->roi);
      if (score >= vendor.logo->threshold) {
        auto& c      = by_vendor[vendor.vendor_name];
        c.vendor     = vendor.vendor_name;
        c.via_logo   = true;
        c.confidence = std::max(c.confidence, score);
      }
    }

    // keywords
    bool excluded = false;
    for (const auto& term : vendor.exclude_terms) {
      if (lower.find(util::ToLower(term)) != std::string::npos) {
        excluded = true;
        break;
      }
    }
    if (excluded) continue;

    std::set<std::string> terms;
    for (const auto& term : vendor.match_terms) terms.insert(util::ToLower(term));
    for (const auto& alias : vendor.aliases) terms.insert(util::ToLower(alias));

    std::size_t matches = 0;
    for (const auto& term : terms) {
      if (!term.empty() && lower.find(term) != std::string::npos) ++matches;
    }
    if (matches == 0) continue;

    auto& c        = by_vendor[vendor.vendor_name];
    c.vendor       = vendor.vendor_name;
    c.term_matches = matches;
    c.confidence   = std::max(c.confidence, KeywordConfidence(matches));
  }

  std::vector<VendorCandidate> ranked;
  ranked.reserve(by_vendor.size());
  for (auto& [_, c] : by_vendor) ranked.push_back(std::move(c));

  std::stable_sort(ranked.begin(), ranked.end(), [](const VendorCandidate& a, const VendorCandidate& b) {
    if (a.via_logo != b.via_logo) return a.via_logo;
    if (a.term_matches != b.term_matches) return a.term_matches > b.term_matches;
    return a.confidence > b.confidence;
  });
  return ranked;
}

VendorMatch VendorDetector::Detect(const std::string& text, const cv::Mat& image) const {
  const auto ranked = Candidates(text, image);

  VendorMatch match;
  if (ranked.empty()) return match;

  const auto& best = ranked.front();
  if (ranked.size() > 1) {
    const auto& runner_up = ranked[1];
    if (!best.via_logo && !runner_up.via_logo && best.term_matches == runner_up.term_matches) {
      match.ambiguous  = true;
      match.confidence = kAmbiguousConfidence;
      return match;
    }
  }

  match.confidence = best.confidence;
  match.via_logo   = best.via_logo;
  if (best.confidence >= min_confidence_) match.vendor = best.vendor;
  return match;
}

} // namespace ticketflow::extract
