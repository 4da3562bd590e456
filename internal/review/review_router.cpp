#include "review_router.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "internal/validate/manifest_validator.hpp"

namespace ticketflow::review {

using db::model::Problem;
using db::model::ReviewReason;
using db::model::Severity;
using db::model::SuggestedFix;

bool ReviewRouter::IsBlocking(const Problem& problem) {
  return problem.blocking && problem.severity >= Severity::Warning;
}

SuggestedFix ReviewRouter::SuggestFix(const Problem& primary, const std::optional<db::model::TruckTicket>& provisional) {
  SuggestedFix fix;
  if (!primary.field.empty()) fix.details["field"] = primary.field;

  switch (primary.reason) {
  case ReviewReason::MissingTicketNumber:
    fix.action = "Enter ticket number from physical ticket";
    break;
  case ReviewReason::MissingManifest:
    fix.action = std::string(validate::kManifestReviewAction);
    break;
  case ReviewReason::InvalidDate:
    fix.action = "Enter ticket date";
    break;
  case ReviewReason::AmbiguousVendor:
    fix.action = "Select vendor";
    break;
  case ReviewReason::UnresolvedReference:
    fix.action = "Add reference data or correct the value";
    fix.details["detail"] = primary.message;
    break;
  case ReviewReason::LowConfidenceOcr:
    fix.action = "Verify extracted values against the scan";
    break;
  case ReviewReason::DuplicateTicket:
    fix.action = "Compare with existing ticket and discard or correct";
    if (provisional && provisional->duplicate_of) fix.details["duplicate_of"] = std::to_string(*provisional->duplicate_of);
    fix.details["comparison"] = primary.message;
    break;
  case ReviewReason::OutOfRangeDate:
    fix.action = "Confirm ticket date";
    break;
  case ReviewReason::UnusualQuantity:
    fix.action = "Confirm quantity and unit";
    break;
  case ReviewReason::DuplicateManifest:
    fix.action = "Confirm manifest number";
    break;
  case ReviewReason::MissingSource:
  case ReviewReason::AssumedVendor:
  case ReviewReason::FilenameOverride:
    fix.action = "No action required";
    break;
  }
  return fix;
}

RoutingDecision ReviewRouter::Route(const ocr::PageMetadata& page, const std::string& request_guid, std::vector<Problem> problems,
                                    std::map<std::string, std::string> detected_fields, std::optional<db::model::TruckTicket> provisional) const {
  RoutingDecision decision;

  const bool blocked = std::any_of(problems.begin(), problems.end(), IsBlocking);

  if (!blocked && provisional) {
    decision.commit = true;
    decision.audit  = std::move(problems);
    for (const auto& p : decision.audit) {
      TICKETFLOW_LOG_INFO("page committed with note",
                          {observability::StringField("page_id", page.PageId()), observability::StringField("reason", db::model::ToString(p.reason)),
                           observability::StringField("severity", db::model::ToString(p.severity)), observability::StringField("message", p.message)});
    }
    return decision;
  }

  if (problems.empty()) {
    // nothing extracted and nothing explained: never drop the page
    problems.push_back(Problem{ReviewReason::MissingTicketNumber, Severity::Critical, "ticket_number", "no ticket could be built from page"});
  }

  // first problem at the highest severity
  const auto primary = std::max_element(problems.begin(), problems.end(), [](const Problem& a, const Problem& b) { return a.severity < b.severity; });

  db::model::ReviewQueueEntry entry;
  entry.page_id         = page.PageId();
  entry.file_id         = page.file_id;
  entry.file_page       = page.page_number;
  entry.request_guid    = request_guid;
  entry.reason          = primary->reason;
  entry.severity        = primary->severity;
  entry.suggested_fix   = SuggestFix(*primary, provisional);
  entry.detected_fields = std::move(detected_fields);
  entry.created_at      = util::Now();

  if (provisional) {
    provisional->review_required = true;
    entry.provisional_ticket     = std::move(provisional);
  }
  entry.problems = std::move(problems);

  TICKETFLOW_LOG_WARN("page routed to review",
                      {observability::StringField("page_id", entry.page_id), observability::StringField("reason", db::model::ToString(entry.reason)),
                       observability::StringField("severity", db::model::ToString(entry.severity)),
                       observability::IntField("problems", static_cast<int64_t>(entry.problems.size()))});

  decision.entry = std::move(entry);
  return decision;
}

} // namespace ticketflow::review
