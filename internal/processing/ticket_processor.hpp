#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/extract/field_extractor.hpp"
#include "internal/extract/vendor_detector.hpp"
#include "internal/normalize/synonym_normalizer.hpp"
#include "internal/ocr/ocr_page.hpp"
#include "internal/processing/filename_parser.hpp"
#include "internal/reference/reference_cache.hpp"
#include "internal/review/review_router.hpp"
#include "internal/templates/vendor_template.hpp"
#include "internal/validate/duplicate_detector.hpp"
#include "internal/validate/manifest_validator.hpp"
#include "internal/validate/range_validator.hpp"

namespace ticketflow::processing {

enum class PageState { Extracting, Validating, Committing, Queued };

std::string_view ToString(PageState state);

struct ProcessorSettings {
  std::string                job_code         = "24-105";
  std::string                ticket_type      = "EXPORT";
  std::string                default_material = "CLASS_2_CONTAMINATED";
  std::optional<std::string> assumed_vendor;

  double vendor_confidence_threshold = 0.80;
  double low_confidence_threshold    = 0.60;
  int    duplicate_window_days       = validate::kDefaultDuplicateWindowDays;

  validate::RangeLimits limits;
};

/*
  Per-file state threaded through every page of that file. Owned by the
  worker processing the file; never shared.
*/
struct FileContext {
  std::string   file_id;
  std::string   file_hash;
  std::string   request_guid;
  FilenameHints hints;

  // rotation of the last page that reported one; inherited by pages that do not
  std::optional<double> last_orientation;
};

struct PageOutcome {
  PageState                       state = PageState::Extracting;
  std::optional<int64_t>          ticket_id;
  std::optional<int64_t>          review_id;
  std::vector<db::model::Problem> problems;

  bool Committed() const {
    return state == PageState::Committing;
  }
};

/*
  EXTRACTING -> VALIDATING -> {COMMITTING | QUEUED}

  Every page ends as exactly one committed ticket or one review entry.
  Nothing here retries: extraction is deterministic for a given page,
  so failures that escape (util::TransientError from persistence) are
  the batch layer's to retry.

  Reference lookups go through the cache before the page transaction
  opens; duplicate checks and the insert share that transaction.

  Safe to call from several workers at once with distinct FileContexts.
*/
class TicketProcessor {
 public:
  TicketProcessor(std::shared_ptr<db::Repository> repository, std::shared_ptr<reference::ReferenceCache> references,
                  std::shared_ptr<const templates::TemplateCatalog> catalog, std::shared_ptr<const normalize::SynonymNormalizer> normalizer,
                  ProcessorSettings settings);

  PageOutcome ProcessPage(FileContext& file, ocr::OcrPage page);

  const ProcessorSettings& Settings() const {
    return settings_;
  }

 private:
  struct Extraction;

  Extraction Extract(FileContext& file, ocr::OcrPage& page) const;
  void       Resolve(Extraction& ex);
  PageOutcome Persist(const FileContext& file, const ocr::PageMetadata& meta, Extraction& ex);

  std::shared_ptr<db::Repository>                     repository_;
  std::shared_ptr<reference::ReferenceCache>          references_;
  std::shared_ptr<const templates::TemplateCatalog>   catalog_;
  std::shared_ptr<const normalize::SynonymNormalizer> normalizer_;
  ProcessorSettings                                   settings_;

  extract::VendorDetector       detector_;
  extract::FieldExtractor       extractor_;
  validate::ManifestValidator   manifest_;
  validate::DuplicateDetector   duplicates_;
  validate::RangeValidator      ranges_;
  review::ReviewRouter          router_;
};

} // namespace ticketflow::processing
