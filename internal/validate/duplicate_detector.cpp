#include "duplicate_detector.hpp"

namespace ticketflow::validate {

using db::model::Problem;
using db::model::TruckTicket;

std::string Summarize(const TruckTicket& ticket) {
  std::string s = "#" + ticket.ticket_number + " " + util::FormatDate(ticket.ticket_date);
  if (ticket.id != 0) s += " id=" + std::to_string(ticket.id);
  s += " " + ticket.file_id + " p" + std::to_string(ticket.file_page);
  if (ticket.quantity) s += " qty=" + std::to_string(*ticket.quantity) + " " + std::string(db::model::ToString(ticket.quantity_unit));
  return s;
}

DuplicateDetector::DuplicateDetector(int window_days) : window_days_(window_days > 0 ? window_days : kDefaultDuplicateWindowDays) {
}

std::optional<TruckTicket> DuplicateDetector::FindPrior(db::Repository& repo, db::Transaction& tx, const TruckTicket& candidate) const {
  const auto from  = util::AddDays(candidate.ticket_date, -window_days_);
  auto       found = repo.FindTicketsInWindow(tx, candidate.ticket_number, candidate.vendor_id, from, candidate.ticket_date);
  for (auto& t : found) {
    if (t.id != candidate.id) return std::move(t);
  }
  return std::nullopt;
}

Problem DuplicateDetector::Flag(TruckTicket& candidate, const TruckTicket& existing) {
  candidate.duplicate_of    = existing.id;
  candidate.review_required = true;

  Problem p;
  p.reason   = db::model::ReviewReason::DuplicateTicket;
  p.severity = db::model::Severity::Warning;
  p.field    = "ticket_number";
  p.message  = "duplicate of " + Summarize(existing) + "; candidate " + Summarize(candidate) + " (" +
              std::to_string(util::DaysBetween(existing.ticket_date, candidate.ticket_date)) + " days apart)";
  return p;
}

std::optional<Problem> DuplicateDetector::Check(db::Repository& repo, db::Transaction& tx, TruckTicket& candidate) const {
  auto prior = FindPrior(repo, tx, candidate);
  if (!prior) return std::nullopt;
  return Flag(candidate, *prior);
}

std::optional<db::model::ProcessedFileRecord> DuplicateDetector::CheckFile(db::Repository& repo, db::Transaction& tx, const std::string& file_hash) const {
  if (file_hash.empty()) return std::nullopt;
  return repo.FindProcessedFile(tx, file_hash);
}

} // namespace ticketflow::validate
