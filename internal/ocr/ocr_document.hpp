#pragma once

#include <string>
#include <vector>

#include "api/ticketflow/ocr/v1/ocr_document.pb.h"
#include "internal/ocr/ocr_page.hpp"

namespace ticketflow::ocr {

OcrPage              FromProto(const ticketflow::ocr::v1::Page& page);
std::vector<OcrPage> FromProto(const ticketflow::ocr::v1::OcrDocument& document);

// Parses the JSON form of OcrDocument. Throws std::runtime_error on malformed input.
ticketflow::ocr::v1::OcrDocument ParseDocumentJson(const std::string& json);

/*
  Rotates every line and word box, and the page image when present,
  from a page scanned at `degrees` (clockwise, multiples of 90) back to
  upright. Other angles are snapped to the nearest quarter turn.
*/
void NormalizeOrientation(OcrPage& page, double degrees);

} // namespace ticketflow::ocr
