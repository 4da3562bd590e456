#include "ticket_processor.hpp"

#include <functional>
#include <map>

#include "internal/extract/field_parsers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/ocr/ocr_document.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace ticketflow::processing {

using db::model::Problem;
using db::model::ReferenceCategory;
using db::model::ReferenceEntity;
using db::model::ReviewReason;
using db::model::Severity;
using templates::FieldName;

std::string_view ToString(PageState state) {
  switch (state) {
  case PageState::Extracting:
    return "EXTRACTING";
  case PageState::Validating:
    return "VALIDATING";
  case PageState::Committing:
    return "COMMITTING";
  case PageState::Queued:
    return "QUEUED";
  }
  return "UNKNOWN";
}

struct TicketProcessor::Extraction {
  std::vector<Problem>               problems;
  std::map<std::string, std::string> detected;
  std::map<std::string, double>      confidence;

  std::optional<std::string>        vendor;
  std::optional<std::string>        ticket_number;
  std::optional<util::Date>         ticket_date;
  std::optional<extract::Quantity>  quantity;
  std::optional<std::string>        manifest;
  std::optional<std::string>        truck;
  std::string                       job;
  std::string                       ticket_type;
  std::string                       material;
  std::optional<std::string>        source;
  std::optional<std::string>        destination;

  // resolved
  std::optional<ReferenceEntity> job_ref;
  std::optional<ReferenceEntity> type_ref;
  std::optional<ReferenceEntity> material_ref;
  std::optional<ReferenceEntity> source_ref;
  std::optional<ReferenceEntity> destination_ref;
  std::optional<ReferenceEntity> vendor_ref;
};

namespace {

Problem MakeProblem(ReviewReason reason, std::string field, std::string message) {
  Problem p;
  p.reason   = reason;
  p.severity = db::model::DefaultSeverity(reason);
  p.field    = std::move(field);
  p.message  = std::move(message);
  return p;
}

// Filename value wins; a different OCR value is noted.
template <typename T>
std::optional<T> PreferHint(const std::optional<T>& hint, std::optional<T> ocr, const std::string& field, std::vector<Problem>& problems,
                            const std::function<std::string(const T&)>& show) {
  if (!hint) return ocr;
  if (ocr && !(*ocr == *hint)) {
    problems.push_back(MakeProblem(ReviewReason::FilenameOverride, field, "filename value " + show(*hint) + " replaces OCR value " + show(*ocr)));
  }
  return hint;
}

std::string Identity(const std::string& s) {
  return s;
}

std::string_view MetricOutcome(const PageOutcome& outcome) {
  if (outcome.Committed()) return "committed";
  for (const auto& p : outcome.problems) {
    if (p.reason == ReviewReason::DuplicateTicket) return "duplicate";
  }
  return "review";
}

} // namespace

TicketProcessor::TicketProcessor(std::shared_ptr<db::Repository> repository, std::shared_ptr<reference::ReferenceCache> references,
                                 std::shared_ptr<const templates::TemplateCatalog> catalog, std::shared_ptr<const normalize::SynonymNormalizer> normalizer,
                                 ProcessorSettings settings)
    : repository_(std::move(repository)),
      references_(std::move(references)),
      catalog_(std::move(catalog)),
      normalizer_(std::move(normalizer)),
      settings_(std::move(settings)),
      detector_(catalog_, settings_.vendor_confidence_threshold),
      extractor_(catalog_),
      duplicates_(settings_.duplicate_window_days),
      ranges_(settings_.limits) {
}

// ------------------------------------------------------------
// EXTRACTING
// ------------------------------------------------------------

TicketProcessor::Extraction TicketProcessor::Extract(FileContext& file, ocr::OcrPage& page) const {
  Extraction ex;
  const auto& hints = file.hints;

  const double angle = page.orientation_degrees ? *page.orientation_degrees : file.last_orientation.value_or(0.0);
  file.last_orientation = angle;
  if (angle != 0.0) ocr::NormalizeOrientation(page, angle);

  // vendor
  auto detected           = detector_.Detect(page.text, page.image);
  ex.confidence["vendor"] = detected.confidence;

  std::optional<std::string> hinted_vendor;
  if (hints.vendor) hinted_vendor = normalizer_->Normalize(ReferenceCategory::Vendor, *hints.vendor);

  if (hinted_vendor) {
    ex.vendor               = PreferHint<std::string>(hinted_vendor, detected.vendor, "vendor", ex.problems, Identity);
    ex.confidence["vendor"] = 1.0;
  } else if (detected.vendor) {
    ex.vendor = detected.vendor;
  } else if (settings_.assumed_vendor) {
    ex.vendor = settings_.assumed_vendor;
    ex.problems.push_back(MakeProblem(ReviewReason::AssumedVendor, "vendor", "vendor not detected; assumed " + *settings_.assumed_vendor));
  } else {
    ex.problems.push_back(MakeProblem(ReviewReason::AmbiguousVendor, "vendor",
                                      detected.ambiguous ? "several vendors match equally" : "no vendor identified with sufficient confidence"));
  }
  if (ex.vendor) ex.detected["vendor"] = *ex.vendor;

  auto field = [&](FieldName name) {
    auto value = extractor_.Extract(page, ex.vendor, name);
    const std::string key(templates::ToString(name));
    if (value.raw) ex.detected[key] = *value.raw;
    ex.confidence[key] = value.confidence;
    return value;
  };

  // ticket number
  const auto number = field(FieldName::TicketNumber);
  if (number.raw) ex.ticket_number = extract::CleanTicketNumber(*number.raw);
  if (!ex.ticket_number) {
    ex.problems.push_back(MakeProblem(ReviewReason::MissingTicketNumber, "ticket_number",
                                      number.raw ? "ticket number '" + *number.raw + "' is not usable" : "ticket number not found"));
  }

  // date
  const auto date = field(FieldName::TicketDate);
  std::optional<util::Date> ocr_date;
  if (date.raw) ocr_date = extract::ParseTicketDate(*date.raw);
  ex.ticket_date = PreferHint<util::Date>(hints.date, ocr_date, "ticket_date", ex.problems, util::FormatDate);
  if (hints.date) ex.confidence["date"] = 1.0;
  if (!ex.ticket_date) {
    ex.problems.push_back(MakeProblem(ReviewReason::InvalidDate, "ticket_date", date.raw ? "unparseable date '" + *date.raw + "'" : "ticket date not found"));
  }

  const auto quantity = field(FieldName::Quantity);
  if (quantity.raw) ex.quantity = extract::ParseQuantity(*quantity.raw);

  const auto manifest = field(FieldName::ManifestNumber);
  if (manifest.raw) ex.manifest = extract::CleanIdentifier(*manifest.raw);

  const auto truck = field(FieldName::TruckNumber);
  if (truck.raw) ex.truck = extract::CleanIdentifier(*truck.raw);

  // vocabulary
  auto normalized = [&](FieldName name, ReferenceCategory category) -> std::optional<std::string> {
    auto value = field(name);
    if (!value.raw) return std::nullopt;
    return normalizer_->Normalize(category, util::Trim(*value.raw));
  };

  std::optional<std::string> hinted_material;
  if (hints.material) hinted_material = normalizer_->Normalize(ReferenceCategory::Material, *hints.material);
  auto material = PreferHint<std::string>(hinted_material, normalized(FieldName::Material, ReferenceCategory::Material), "material", ex.problems, Identity);
  ex.material   = material.value_or(settings_.default_material);

  std::optional<std::string> hinted_source;
  if (hints.source_area) hinted_source = normalizer_->Normalize(ReferenceCategory::Source, *hints.source_area);
  ex.source = PreferHint<std::string>(hinted_source, normalized(FieldName::Source, ReferenceCategory::Source), "source", ex.problems, Identity);

  ex.destination = normalized(FieldName::Destination, ReferenceCategory::Destination);

  ex.job         = hints.job_code.value_or(settings_.job_code);
  ex.ticket_type = hints.ticket_type.value_or(settings_.ticket_type);

  // required fields read from the page with weak OCR support
  for (const auto* key : {"ticket_number", "date"}) {
    auto it = ex.confidence.find(key);
    if (it != ex.confidence.end() && ex.detected.count(key) && it->second < settings_.low_confidence_threshold) {
      ex.problems.push_back(MakeProblem(ReviewReason::LowConfidenceOcr, key, std::string(key) + " confidence " + std::to_string(it->second)));
    }
  }
  return ex;
}

// ------------------------------------------------------------
// Reference resolution (cache, outside the page transaction)
// ------------------------------------------------------------

void TicketProcessor::Resolve(Extraction& ex) {
  auto require = [&](ReferenceCategory category, const std::string& name, const char* field) -> std::optional<ReferenceEntity> {
    auto entity = references_->Lookup(category, name);
    if (!entity) {
      ex.problems.push_back(
          MakeProblem(ReviewReason::UnresolvedReference, field, "unresolved " + std::string(db::model::ToString(category)) + " '" + name + "'"));
    }
    return entity;
  };

  ex.job_ref      = require(ReferenceCategory::Job, ex.job, "job");
  ex.type_ref     = require(ReferenceCategory::TicketType, ex.ticket_type, "ticket_type");
  ex.material_ref = require(ReferenceCategory::Material, ex.material, "material");

  if (ex.vendor) ex.vendor_ref = require(ReferenceCategory::Vendor, *ex.vendor, "vendor");

  if (ex.destination) {
    ex.destination_ref = require(ReferenceCategory::Destination, *ex.destination, "destination");
  } else if (ex.vendor) {
    // disposal sites issue their own tickets
    ex.destination_ref = references_->Lookup(ReferenceCategory::Destination, *ex.vendor);
  }

  if (ex.source) ex.source_ref = references_->Lookup(ReferenceCategory::Source, *ex.source);
  if (!ex.source_ref) {
    ex.problems.push_back(MakeProblem(ReviewReason::MissingSource, "source", ex.source ? "unknown source '" + *ex.source + "'" : "source not found"));
  }
}

// ------------------------------------------------------------
// VALIDATING -> COMMITTING | QUEUED
// ------------------------------------------------------------

PageOutcome TicketProcessor::Persist(const FileContext& file, const ocr::PageMetadata& meta, Extraction& ex) {
  std::optional<db::model::TruckTicket> ticket;
  std::optional<int>                    decimals;

  if (ex.ticket_number && ex.ticket_date) {
    db::model::TruckTicket t;
    t.ticket_number = *ex.ticket_number;
    t.ticket_date   = *ex.ticket_date;
    if (ex.quantity) {
      t.quantity      = ex.quantity->value;
      t.quantity_unit = ex.quantity->unit;
      decimals        = ex.quantity->decimals;
    }
    if (ex.job_ref) t.job_id = ex.job_ref->id;
    if (ex.type_ref) t.ticket_type_id = ex.type_ref->id;
    if (ex.material_ref) t.material_id = ex.material_ref->id;
    if (ex.source_ref) t.source_id = ex.source_ref->id;
    if (ex.destination_ref) t.destination_id = ex.destination_ref->id;
    if (ex.vendor_ref) t.vendor_id = ex.vendor_ref->id;
    t.manifest_number = ex.manifest;
    t.truck_number    = ex.truck;
    t.file_id         = file.file_id;
    t.file_page       = meta.page_number;
    t.file_hash       = file.file_hash;
    t.request_guid    = file.request_guid;
    t.created_at      = util::Now();

    t.field_confidence = ex.confidence;
    double sum         = 0.0;
    for (const auto* key : {"ticket_number", "date"}) sum += ex.confidence[key];
    t.confidence = sum / 2.0;

    ticket = std::move(t);
  }

  // a regulated material is checked even when the page is going to review anyway
  if (ticket && ex.material_ref) {
    auto problems = manifest_.Validate(*ticket, *ex.material_ref);
    ex.problems.insert(ex.problems.end(), problems.begin(), problems.end());
  }
  if (ticket) {
    auto problems = ranges_.Validate(*ticket, decimals, util::Today());
    ex.problems.insert(ex.problems.end(), problems.begin(), problems.end());
  }

  auto tx = repository_->Begin();

  if (ticket) {
    if (auto dup = duplicates_.Check(*repository_, *tx, *ticket)) ex.problems.push_back(std::move(*dup));
    if (auto dup = manifest_.CheckDuplicateManifest(*repository_, *tx, *ticket)) ex.problems.push_back(std::move(*dup));
  }

  PageOutcome outcome;
  auto        decision = router_.Route(meta, file.request_guid, ex.problems, ex.detected, ticket);

  if (decision.commit) {
    auto r = repository_->InsertTicket(*tx, *ticket);
    if (r.code == db::ErrorCode::ConstraintViolation) {
      // lost a race on (ticket_number, vendor, date): take the duplicate path
      auto prior = duplicates_.FindPrior(*repository_, *tx, *ticket);
      if (!prior) util::ThrowIfDbError(r, "insert ticket " + ticket->ticket_number);
      ex.problems.push_back(validate::DuplicateDetector::Flag(*ticket, *prior));
      decision = router_.Route(meta, file.request_guid, ex.problems, ex.detected, ticket);
    } else {
      util::ThrowIfDbError(r, "insert ticket " + ticket->ticket_number);
      outcome.state     = PageState::Committing;
      outcome.ticket_id = ticket->id;
    }
  }

  if (decision.entry) {
    util::ThrowIfDbError(repository_->InsertReviewEntry(*tx, *decision.entry), "insert review entry " + meta.PageId());
    outcome.state     = PageState::Queued;
    outcome.review_id = decision.entry->id;
  }

  tx->Commit();

  outcome.problems = std::move(ex.problems);
  return outcome;
}

PageOutcome TicketProcessor::ProcessPage(FileContext& file, ocr::OcrPage page) {
  ocr::PageMetadata meta{file.file_id, page.page_number, file.file_hash};

  observability::SpanScope span("ticketflow.page");
  span.SetAttribute("page_id", meta.PageId());

  Extraction  ex;
  PageOutcome outcome;
  try {
    ex = Extract(file, page);
    Resolve(ex);
    outcome = Persist(file, meta, ex);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordPage("error");
    throw;
  }

  span.SetAttribute("state", ToString(outcome.state));
  observability::Metrics::Instance().RecordPage(MetricOutcome(outcome));

  TICKETFLOW_LOG_DEBUG("page processed", {observability::StringField("page_id", meta.PageId()), observability::StringField("state", ToString(outcome.state)),
                                          observability::IntField("problems", static_cast<int64_t>(outcome.problems.size())),
                                          observability::DoubleField("number_confidence", ex.confidence.contains("ticket_number") ? ex.confidence.at("ticket_number") : 0.0)});
  return outcome;
}

} // namespace ticketflow::processing
