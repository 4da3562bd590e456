#pragma once

#include <opencv2/core.hpp>

#include "internal/ocr/ocr_page.hpp"

namespace ticketflow::extract {

/*
  TM_CCOEFF_NORMED score of a logo template slid over the part of the
  page inside roi. Both images are CV_8UC1.

  Returns the best score in [-1, 1]; -1 when either image is empty or
  the template does not fit inside the region.
*/
double MatchLogo(const cv::Mat& page, const cv::Mat& logo, const ocr::BoundingBox& roi);

} // namespace ticketflow::extract
