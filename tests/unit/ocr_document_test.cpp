#include "internal/ocr/ocr_document.hpp"

#include <opencv2/core.hpp>

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "internal/util/file_hash.hpp"

namespace {

using namespace ticketflow;

bool Near(double a, double b) {
  return std::abs(a - b) < 1e-9;
}

const char* kDocument = R"({
  "source_file": "wm.pdf",
  "pages": [
    {
      "page_number": 1,
      "text": "WASTE MANAGEMENT\nTICKET 5012345",
      "lines": [
        {
          "text": "TICKET 5012345",
          "bbox": {"x_min": 0.6, "y_min": 0.1, "x_max": 0.9, "y_max": 0.12},
          "words": [
            {"value": "TICKET", "bbox": {"x_min": 0.6, "y_min": 0.1, "x_max": 0.7, "y_max": 0.12}, "confidence": 0.97},
            {"value": "5012345", "bbox": {"x_min": 0.72, "y_min": 0.1, "x_max": 0.9, "y_max": 0.12}},
            {"value": "SMUDGE", "bbox": {"x_min": 0.1, "y_min": 0.1, "x_max": 0.2, "y_max": 0.12}, "confidence": 0}
          ]
        }
      ],
      "orientation_degrees": 0,
      "image": {"width": 2, "height": 2, "pixels": "AP//AA=="},
      "engine": "ignored"
    },
    {
      "text": "page two"
    }
  ]
})";

void TestJsonDocumentToPages() {
  auto pages = ocr::FromProto(ocr::ParseDocumentJson(kDocument));
  assert(pages.size() == 2);

  const auto& first = pages[0];
  assert(first.page_number == 1);
  assert(first.lines.size() == 1);
  assert(first.lines[0].words.size() == 3);
  assert(Near(first.lines[0].words[0].confidence, 0.97));
  assert(first.lines[0].words[1].confidence == 1.0); // unset => trusted
  assert(first.lines[0].words[2].confidence == 0.0); // explicit zero is kept
  assert(first.orientation_degrees && *first.orientation_degrees == 0.0);
  assert(first.image.type() == CV_8UC1 && first.image.cols == 2 && first.image.rows == 2);
  assert(first.image.at<uchar>(0, 1) == 255 && first.image.at<uchar>(1, 1) == 0);

  const auto& second = pages[1];
  assert(second.page_number == 2);
  assert(!second.orientation_degrees);
  assert(second.image.empty());
}

void TestMalformedInputThrows() {
  bool threw = false;
  try {
    ocr::ParseDocumentJson("{\"pages\": 7}");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  ticketflow::ocr::v1::Page page;
  page.mutable_image()->set_width(3);
  page.mutable_image()->set_height(3);
  page.mutable_image()->set_pixels(std::string(4, '\0'));
  threw = false;
  try {
    ocr::FromProto(page);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestOrientationNormalization() {
  ocr::OcrPage page;
  ocr::OcrLine line;
  line.text = "X";
  line.bbox = {0.1, 0.2, 0.3, 0.4};
  line.words.push_back({"X", {0.1, 0.2, 0.3, 0.4}, 1.0});
  page.lines.push_back(line);

  auto quarter = page;
  ocr::NormalizeOrientation(quarter, 90);
  const auto& q = quarter.lines[0].bbox;
  assert(Near(q.x_min, 0.2) && Near(q.y_min, 0.7) && Near(q.x_max, 0.4) && Near(q.y_max, 0.9));
  assert(Near(quarter.lines[0].words[0].bbox.y_min, 0.7));

  auto half = page;
  ocr::NormalizeOrientation(half, 180);
  const auto& h = half.lines[0].bbox;
  assert(Near(h.x_min, 0.7) && Near(h.y_min, 0.6) && Near(h.x_max, 0.9) && Near(h.y_max, 0.8));

  // -90 is the same quarter turn as 270; 3 degrees snaps to upright
  auto left  = page;
  auto three = page;
  ocr::NormalizeOrientation(left, -90);
  auto other = page;
  ocr::NormalizeOrientation(other, 270);
  assert(Near(left.lines[0].bbox.x_min, other.lines[0].bbox.x_min) && Near(left.lines[0].bbox.y_min, other.lines[0].bbox.y_min));
  ocr::NormalizeOrientation(three, 3);
  assert(Near(three.lines[0].bbox.x_min, 0.1) && Near(three.lines[0].bbox.y_max, 0.4));
}

void TestOrientationRotatesImage() {
  // 2 rows x 3 cols scanned 90 cw; the top-right marker ends up top-left
  ocr::OcrPage page;
  page.image = cv::Mat(2, 3, CV_8UC1, cv::Scalar(0));
  page.image.at<uchar>(0, 2) = 200;

  ocr::NormalizeOrientation(page, 90);
  assert(page.image.rows == 3 && page.image.cols == 2);
  assert(page.image.at<uchar>(0, 0) == 200);

  ocr::OcrPage flipped;
  flipped.image = cv::Mat(2, 3, CV_8UC1, cv::Scalar(0));
  flipped.image.at<uchar>(0, 0) = 50;
  ocr::NormalizeOrientation(flipped, 180);
  assert(flipped.image.rows == 2 && flipped.image.at<uchar>(1, 2) == 50);
}

void TestSha256() {
  assert(util::Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(util::Sha256Hex("").size() == 64);
}

} // namespace

int main() {
  TestJsonDocumentToPages();
  TestMalformedInputThrows();
  TestOrientationNormalization();
  TestOrientationRotatesImage();
  TestSha256();

  std::cout << "ticketflow_unit_ocr_document: pass\n";
  return 0;
}
