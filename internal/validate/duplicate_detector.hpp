#pragma once

#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/review_entry.hpp"
#include "internal/db/model/truck_ticket.hpp"

namespace ticketflow::validate {

inline constexpr int kDefaultDuplicateWindowDays = 120;

/*
  Ticket-level and file-level duplicate checks.

  Ticket level: keyed on (ticket_number, vendor_id). The window looks
  back from the candidate's own date, [date - window, date], whatever
  order tickets arrive in. Tickets dated after the candidate are never
  its prior duplicate. Only committed tickets are considered.

  File level: exact SHA-256 match against the processed-file ledger.

  Both run inside the caller's transaction so check and insert see the
  same state. The uniqueness constraint in the repository still decides
  races between workers.
*/
class DuplicateDetector {
 public:
  explicit DuplicateDetector(int window_days = kDefaultDuplicateWindowDays);

  // Oldest committed ticket in the window, if any.
  std::optional<db::model::TruckTicket> FindPrior(db::Repository& repo, db::Transaction& tx, const db::model::TruckTicket& candidate) const;

  // On a match sets duplicate_of and review_required and returns a DUPLICATE_TICKET warning.
  std::optional<db::model::Problem> Check(db::Repository& repo, db::Transaction& tx, db::model::TruckTicket& candidate) const;

  std::optional<db::model::ProcessedFileRecord> CheckFile(db::Repository& repo, db::Transaction& tx, const std::string& file_hash) const;

  // Marks candidate as duplicate of existing. Used after a lost insert race too.
  static db::model::Problem Flag(db::model::TruckTicket& candidate, const db::model::TruckTicket& existing);

  int WindowDays() const {
    return window_days_;
  }

 private:
  int window_days_;
};

std::string Summarize(const db::model::TruckTicket& ticket);

} // namespace ticketflow::validate
