#pragma once

#include <optional>
#include <string_view>

namespace ticketflow::db::model {

enum class QuantityUnit { Tons, CubicYards, Loads };

enum class ReferenceCategory { Job, Material, Source, Destination, Vendor, TicketType };

// Ordered: a larger value is more severe.
enum class Severity { Info = 0, Warning = 1, Critical = 2 };

enum class ReviewReason {
  MissingTicketNumber,
  MissingManifest,
  InvalidDate,
  AmbiguousVendor,
  UnresolvedReference,

  LowConfidenceOcr,
  DuplicateTicket,
  OutOfRangeDate,
  UnusualQuantity,
  DuplicateManifest,

  MissingSource,
  AssumedVendor,
  FilenameOverride
};

enum class RunStatus { InProgress, Completed, Failed };

std::string_view ToString(QuantityUnit unit);
std::string_view ToString(ReferenceCategory category);
std::string_view ToString(Severity severity);
std::string_view ToString(ReviewReason reason);
std::string_view ToString(RunStatus status);

std::optional<QuantityUnit>      ParseQuantityUnit(std::string_view text);
std::optional<ReferenceCategory> ParseReferenceCategory(std::string_view text);
std::optional<Severity>          ParseSeverity(std::string_view text);
std::optional<ReviewReason>      ParseReviewReason(std::string_view text);
std::optional<RunStatus>         ParseRunStatus(std::string_view text);

Severity DefaultSeverity(ReviewReason reason);

} // namespace ticketflow::db::model
