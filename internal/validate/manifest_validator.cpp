#include "manifest_validator.hpp"

namespace ticketflow::validate {

using db::model::Problem;
using db::model::ReviewReason;
using db::model::Severity;

bool IsValidManifestFormat(std::string_view manifest) {
  return db::model::IsValidManifestNumber(manifest);
}

std::vector<Problem> ManifestValidator::Validate(db::model::TruckTicket& ticket, const db::model::ReferenceEntity& material) const {
  std::vector<Problem> problems;
  if (!material.RequiresManifest()) return problems;

  if (ticket.manifest_number && IsValidManifestFormat(*ticket.manifest_number)) return problems;

  ticket.review_required = true;

  Problem p;
  p.reason   = ReviewReason::MissingManifest;
  p.severity = Severity::Critical;
  p.field    = "manifest_number";
  p.message  = ticket.manifest_number ? "manifest number '" + *ticket.manifest_number + "' is not 6-20 alphanumeric characters (material " + material.canonical_name + ")"
                                      : "material " + material.canonical_name + " requires a manifest number";
  problems.push_back(std::move(p));
  return problems;
}

std::optional<Problem> ManifestValidator::CheckDuplicateManifest(db::Repository& repo, db::Transaction& tx, const db::model::TruckTicket& ticket) const {
  if (!ticket.manifest_number || !IsValidManifestFormat(*ticket.manifest_number)) return std::nullopt;

  auto existing = repo.FindTicketsByManifest(tx, ticket.vendor_id, ticket.ticket_date, *ticket.manifest_number);
  for (const auto& other : existing) {
    if (other.ticket_number == ticket.ticket_number) continue;

    Problem p;
    p.reason   = ReviewReason::DuplicateManifest;
    p.severity = Severity::Warning;
    p.field    = "manifest_number";
    p.message  = "manifest " + *ticket.manifest_number + " already used by ticket " + other.ticket_number + " (id " + std::to_string(other.id) + ")";
    p.blocking = false;
    return p;
  }
  return std::nullopt;
}

} // namespace ticketflow::validate
