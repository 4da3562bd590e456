#pragma once

#include <opencv2/core.hpp>

#include <optional>
#include <string>
#include <vector>

namespace ticketflow::ocr {

// Normalized [0,1] coordinates, origin top-left.
struct BoundingBox {
  double x_min = 0.0;
  double y_min = 0.0;
  double x_max = 0.0;
  double y_max = 0.0;

  double CenterX() const {
    return (x_min + x_max) / 2.0;
  }
  double CenterY() const {
    return (y_min + y_max) / 2.0;
  }
  bool ContainsPoint(double x, double y) const {
    return x >= x_min && x <= x_max && y >= y_min && y <= y_max;
  }
};

struct OcrWord {
  std::string value;
  BoundingBox bbox;
  double      confidence = 1.0;
};

struct OcrLine {
  std::string          text;
  std::vector<OcrWord> words;
  BoundingBox          bbox;
};

/*
  One recognized page as handed over by the OCR collaborator.

  orientation_degrees is the clockwise rotation the engine detected
  (0/90/180/270); absent when detection did not run or failed.
  image is the CV_8UC1 raster of the page, empty when none was sent.
*/
struct OcrPage {
  int                      page_number = 1;
  std::string              text;
  std::vector<OcrLine>     lines;
  std::optional<double>    orientation_degrees;
  cv::Mat                  image;
};

struct PageMetadata {
  std::string file_id;
  int         page_number = 1;
  std::string file_hash;

  std::string PageId() const {
    return file_id + "#page" + std::to_string(page_number);
  }
};

} // namespace ticketflow::ocr
