#include "ocr_document.hpp"

#include <google/protobuf/util/json_util.h>
#include <opencv2/core.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>

namespace ticketflow::ocr {
namespace {

BoundingBox FromProto(const ticketflow::ocr::v1::BoundingBox& box) {
  return {box.x_min(), box.y_min(), box.x_max(), box.y_max()};
}

// Maps a point on the rotated scan back to the upright page.
void RotatePoint(int quarter_turns, double x, double y, double& out_x, double& out_y) {
  switch (quarter_turns) {
    case 1: // scan rotated 90 cw
      out_x = y;
      out_y = 1.0 - x;
      break;
    case 2:
      out_x = 1.0 - x;
      out_y = 1.0 - y;
      break;
    case 3:
      out_x = 1.0 - y;
      out_y = x;
      break;
    default:
      out_x = x;
      out_y = y;
      break;
  }
}

BoundingBox RotateBox(const BoundingBox& box, int quarter_turns) {
  double ax = 0, ay = 0, bx = 0, by = 0;
  RotatePoint(quarter_turns, box.x_min, box.y_min, ax, ay);
  RotatePoint(quarter_turns, box.x_max, box.y_max, bx, by);
  return {std::min(ax, bx), std::min(ay, by), std::max(ax, bx), std::max(ay, by)};
}

} // namespace

OcrPage FromProto(const ticketflow::ocr::v1::Page& page) {
  OcrPage out;
  out.page_number = page.page_number() > 0 ? static_cast<int>(page.page_number()) : 1;
  out.text        = page.text();
  if (page.has_orientation_degrees()) out.orientation_degrees = page.orientation_degrees();

  for (const auto& line : page.lines()) {
    OcrLine l;
    l.text = line.text();
    l.bbox = FromProto(line.bbox());
    for (const auto& word : line.words()) {
      l.words.push_back({word.value(), FromProto(word.bbox()), word.has_confidence() ? std::clamp(word.confidence(), 0.0, 1.0) : 1.0});
    }
    out.lines.push_back(std::move(l));
  }

  const auto& image = page.image();
  if (image.width() > 0 && image.height() > 0) {
    const auto rows = static_cast<std::size_t>(image.height());
    const auto cols = static_cast<std::size_t>(image.width());
    if (image.pixels().size() != rows * cols) {
      throw std::runtime_error("page " + std::to_string(out.page_number) + ": image size does not match pixel buffer");
    }
    out.image.create(static_cast<int>(rows), static_cast<int>(cols), CV_8UC1);
    std::memcpy(out.image.data, image.pixels().data(), image.pixels().size());
  }
  return out;
}

std::vector<OcrPage> FromProto(const ticketflow::ocr::v1::OcrDocument& document) {
  std::vector<OcrPage> pages;
  pages.reserve(document.pages_size());
  int index = 1;
  for (const auto& page : document.pages()) {
    auto p = FromProto(page);
    if (page.page_number() == 0) p.page_number = index;
    pages.push_back(std::move(p));
    ++index;
  }
  return pages;
}

ticketflow::ocr::v1::OcrDocument ParseDocumentJson(const std::string& json) {
  ticketflow::ocr::v1::OcrDocument document;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &document, options);
  if (!status.ok()) {
    throw std::runtime_error("invalid OCR document: " + std::string(status.message()));
  }
  return document;
}

void NormalizeOrientation(OcrPage& page, double degrees) {
  int quarter_turns = static_cast<int>(std::lround(degrees / 90.0)) % 4;
  if (quarter_turns < 0) quarter_turns += 4;
  if (quarter_turns == 0) return;

  for (auto& line : page.lines) {
    line.bbox = RotateBox(line.bbox, quarter_turns);
    for (auto& word : line.words) word.bbox = RotateBox(word.bbox, quarter_turns);
  }

  if (!page.image.empty()) {
    static constexpr cv::RotateFlags kUpright[] = {cv::ROTATE_90_COUNTERCLOCKWISE, cv::ROTATE_180, cv::ROTATE_90_CLOCKWISE};
    cv::Mat upright;
    cv::rotate(page.image, upright, kUpright[quarter_turns - 1]);
    page.image = upright;
  }
}

} // namespace ticketflow::ocr
