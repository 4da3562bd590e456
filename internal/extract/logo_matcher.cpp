#include "logo_matcher.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace ticketflow::extract {

double MatchLogo(const cv::Mat& page, const cv::Mat& logo, const ocr::BoundingBox& roi) {
  if (page.empty() || logo.empty()) return -1.0;

  const int x0 = std::clamp(static_cast<int>(std::floor(roi.x_min * page.cols)), 0, page.cols);
  const int y0 = std::clamp(static_cast<int>(std::floor(roi.y_min * page.rows)), 0, page.rows);
  const int x1 = std::clamp(static_cast<int>(std::ceil(roi.x_max * page.cols)), 0, page.cols);
  const int y1 = std::clamp(static_cast<int>(std::ceil(roi.y_max * page.rows)), 0, page.rows);

  const cv::Rect region(x0, y0, x1 - x0, y1 - y0);
  if (region.width < logo.cols || region.height < logo.rows) return -1.0;

  cv::Mat scores;
  cv::matchTemplate(page(region), logo, scores, cv::TM_CCOEFF_NORMED);

  double best = -1.0;
  cv::minMaxLoc(scores, nullptr, &best);
  return best;
}

} // namespace ticketflow::extract
