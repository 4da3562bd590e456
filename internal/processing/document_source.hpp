#pragma once

#include <functional>
#include <memory>
#include <string>

#include "internal/ocr/ocr_page.hpp"

namespace ticketflow::processing {

/*
  Pages of one opened file, read in physical order by a single worker.
  ReadPage may throw util::TransientError for engine/I/O failures.
*/
class PageReader {
 public:
  virtual ~PageReader() = default;

  virtual int          PageCount() const = 0;
  virtual ocr::OcrPage ReadPage(int index) = 0;
};

/*
  Boundary to rasterization + OCR. One instance per worker so engine
  state can be reused across the pages and files that worker handles.
*/
class DocumentSource {
 public:
  virtual ~DocumentSource() = default;

  // SHA-256 hex of the file bytes.
  virtual std::string                 HashFile(const std::string& path) = 0;
  virtual std::unique_ptr<PageReader> Open(const std::string& path)     = 0;
};

using DocumentSourceFactory = std::function<std::unique_ptr<DocumentSource>()>;

/*
  Reads OCR results previously written next to the scan as
  "<file>.ocr.json" (JSON form of ticketflow.ocr.v1.OcrDocument).
*/
class SidecarDocumentSource : public DocumentSource {
 public:
  static std::string SidecarPath(const std::string& path) {
    return path + ".ocr.json";
  }

  std::string                 HashFile(const std::string& path) override;
  std::unique_ptr<PageReader> Open(const std::string& path) override;
};

} // namespace ticketflow::processing
