#include "codes.hpp"

#include <array>
#include <utility>

namespace ticketflow::db::model {
namespace {

template <typename Enum, std::size_t N>
std::string_view Lookup(const std::array<std::pair<Enum, std::string_view>, N>& table, Enum value) {
  for (const auto& [e, name] : table) {
    if (e == value) return name;
  }
  return "UNKNOWN";
}

template <typename Enum, std::size_t N>
std::optional<Enum> Reverse(const std::array<std::pair<Enum, std::string_view>, N>& table, std::string_view text) {
  for (const auto& [e, name] : table) {
    if (name == text) return e;
  }
  return std::nullopt;
}

constexpr std::array<std::pair<QuantityUnit, std::string_view>, 3> kUnits{{
    {QuantityUnit::Tons, "TONS"},
    {QuantityUnit::CubicYards, "CY"},
    {QuantityUnit::Loads, "LOADS"},
}};

constexpr std::array<std::pair<ReferenceCategory, std::string_view>, 6> kCategories{{
    {ReferenceCategory::Job, "JOB"},
    {ReferenceCategory::Material, "MATERIAL"},
    {ReferenceCategory::Source, "SOURCE"},
    {ReferenceCategory::Destination, "DESTINATION"},
    {ReferenceCategory::Vendor, "VENDOR"},
    {ReferenceCategory::TicketType, "TICKET_TYPE"},
}};

constexpr std::array<std::pair<Severity, std::string_view>, 3> kSeverities{{
    {Severity::Info, "INFO"},
    {Severity::Warning, "WARNING"},
    {Severity::Critical, "CRITICAL"},
}};

constexpr std::array<std::pair<ReviewReason, std::string_view>, 13> kReasons{{
    {ReviewReason::MissingTicketNumber, "MISSING_TICKET_NUMBER"},
    {ReviewReason::MissingManifest, "MISSING_MANIFEST"},
    {ReviewReason::InvalidDate, "INVALID_DATE"},
    {ReviewReason::AmbiguousVendor, "AMBIGUOUS_VENDOR"},
    {ReviewReason::UnresolvedReference, "UNRESOLVED_REFERENCE"},
    {ReviewReason::LowConfidenceOcr, "LOW_CONFIDENCE_OCR"},
    {ReviewReason::DuplicateTicket, "DUPLICATE_TICKET"},
    {ReviewReason::OutOfRangeDate, "OUT_OF_RANGE_DATE"},
    {ReviewReason::UnusualQuantity, "UNUSUAL_QUANTITY"},
    {ReviewReason::DuplicateManifest, "DUPLICATE_MANIFEST"},
    {ReviewReason::MissingSource, "MISSING_SOURCE"},
    {ReviewReason::AssumedVendor, "ASSUMED_VENDOR"},
    {ReviewReason::FilenameOverride, "FILENAME_OVERRIDE"},
}};

constexpr std::array<std::pair<RunStatus, std::string_view>, 3> kRunStatuses{{
    {RunStatus::InProgress, "IN_PROGRESS"},
    {RunStatus::Completed, "COMPLETED"},
    {RunStatus::Failed, "FAILED"},
}};

} // namespace

std::string_view ToString(QuantityUnit unit) {
  return Lookup(kUnits, unit);
}

std::string_view ToString(ReferenceCategory category) {
  return Lookup(kCategories, category);
}

std::string_view ToString(Severity severity) {
  return Lookup(kSeverities, severity);
}

std::string_view ToString(ReviewReason reason) {
  return Lookup(kReasons, reason);
}

std::string_view ToString(RunStatus status) {
  return Lookup(kRunStatuses, status);
}

std::optional<QuantityUnit> ParseQuantityUnit(std::string_view text) {
  return Reverse(kUnits, text);
}

std::optional<ReferenceCategory> ParseReferenceCategory(std::string_view text) {
  return Reverse(kCategories, text);
}

std::optional<Severity> ParseSeverity(std::string_view text) {
  return Reverse(kSeverities, text);
}

std::optional<ReviewReason> ParseReviewReason(std::string_view text) {
  return Reverse(kReasons, text);
}

std::optional<RunStatus> ParseRunStatus(std::string_view text) {
  return Reverse(kRunStatuses, text);
}

Severity DefaultSeverity(ReviewReason reason) {
  switch (reason) {
    case ReviewReason::MissingTicketNumber:
    case ReviewReason::MissingManifest:
    case ReviewReason::InvalidDate:
    case ReviewReason::AmbiguousVendor:
    case ReviewReason::UnresolvedReference:
      return Severity::Critical;

    case ReviewReason::LowConfidenceOcr:
    case ReviewReason::DuplicateTicket:
    case ReviewReason::OutOfRangeDate:
    case ReviewReason::UnusualQuantity:
    case ReviewReason::DuplicateManifest:
      return Severity::Warning;

    case ReviewReason::MissingSource:
    case ReviewReason::AssumedVendor:
    case ReviewReason::FilenameOverride:
      return Severity::Info;
  }
  return Severity::Critical;
}

} // namespace ticketflow::db::model
