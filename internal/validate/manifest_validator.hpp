#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/reference_entity.hpp"
#include "internal/db/model/review_entry.hpp"
#include "internal/db/model/truck_ticket.hpp"

namespace ticketflow::validate {

// Alphanumeric, 6 to 20 characters.
bool IsValidManifestFormat(std::string_view manifest);

inline constexpr std::string_view kManifestReviewAction = "Manually review ticket and enter manifest number from physical ticket";

/*
  Regulated-material compliance.

  Validate is the one place the manifest invariant is decided: a ticket
  whose material requires a manifest leaves here either with a valid
  manifest number or with review_required set and a CRITICAL
  MISSING_MANIFEST problem. The repositories re-check the invariant at
  commit time.
*/
class ManifestValidator {
 public:
  std::vector<db::model::Problem> Validate(db::model::TruckTicket& ticket, const db::model::ReferenceEntity& material) const;

  // Same manifest already committed for this vendor on this date. Non-blocking WARNING.
  std::optional<db::model::Problem> CheckDuplicateManifest(db::Repository& repo, db::Transaction& tx, const db::model::TruckTicket& ticket) const;
};

} // namespace ticketflow::validate
