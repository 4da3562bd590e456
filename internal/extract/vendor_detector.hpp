#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "internal/ocr/ocr_page.hpp"
#include "internal/templates/vendor_template.hpp"

namespace ticketflow::extract {

struct VendorCandidate {
  std::string vendor;
  double      confidence   = 0.0;
  bool        via_logo     = false;
  std::size_t term_matches = 0;
};

struct VendorMatch {
  std::optional<std::string> vendor; // null => route AMBIGUOUS_VENDOR
  double                     confidence = 0.0;
  bool                       via_logo   = false;
  bool                       ambiguous  = false;
};

/*
  Identifies the issuing vendor of a page.

  Logo matching (when the vendor has a logo and the page image is not
  empty) and keyword matching both produce candidates. Ranking: logo
  before keyword, then more literal term matches, then confidence.
  Two keyword-only vendors with the same term count are ambiguous.
  Anything under min_confidence comes back as a null vendor.

  Pure over its inputs and the catalog.
*/
class VendorDetector {
 public:
  explicit VendorDetector(std::shared_ptr<const templates::TemplateCatalog> catalog, double min_confidence = 0.80);

  VendorMatch Detect(const std::string& text, const cv::Mat& image = cv::Mat()) const;

  // Ranked, best first.
  std::vector<VendorCandidate> Candidates(const std::string& text, const cv::Mat& image = cv::Mat()) const;

 private:
  std::shared_ptr<const templates::TemplateCatalog> catalog_;
  double                                            min_confidence_;
};

} // namespace ticketflow::extract
