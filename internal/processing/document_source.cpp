#include "document_source.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "internal/ocr/ocr_document.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_hash.hpp"

namespace ticketflow::processing {
namespace {

class LoadedPages : public PageReader {
 public:
  explicit LoadedPages(std::vector<ocr::OcrPage> pages) : pages_(std::move(pages)) {
  }

  int PageCount() const override {
    return static_cast<int>(pages_.size());
  }

  ocr::OcrPage ReadPage(int index) override {
    if (index < 0 || index >= PageCount()) throw std::out_of_range("page index " + std::to_string(index));
    return pages_[static_cast<std::size_t>(index)];
  }

 private:
  std::vector<ocr::OcrPage> pages_;
};

} // namespace

std::string SidecarDocumentSource::HashFile(const std::string& path) {
  return util::Sha256File(path);
}

std::unique_ptr<PageReader> SidecarDocumentSource::Open(const std::string& path) {
  const auto sidecar = SidecarPath(path);
  if (!std::filesystem::exists(sidecar)) throw std::runtime_error("no OCR output for " + path + " (expected " + sidecar + ")");

  std::ifstream in(sidecar, std::ios::binary);
  if (!in) throw util::TransientError("cannot open " + sidecar);

  std::stringstream ss;
  ss << in.rdbuf();
  if (in.bad()) throw util::TransientError("read failed: " + sidecar);

  auto pages = ocr::FromProto(ocr::ParseDocumentJson(ss.str()));
  for (std::size_t i = 0; i < pages.size(); ++i) {
    if (pages[i].page_number <= 0) pages[i].page_number = static_cast<int>(i) + 1;
  }
  return std::make_unique<LoadedPages>(std::move(pages));
}

} // namespace ticketflow::processing
