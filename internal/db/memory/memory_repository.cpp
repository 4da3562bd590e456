#include "memory_repository.hpp"

#include <algorithm>
#include <set>

#include "memory_tx.hpp"

namespace ticketflow::db::memory {

namespace {

bool SameTicketKey(const model::TruckTicket& a, const model::TruckTicket& b) {
  return a.ticket_number == b.ticket_number && a.vendor_id == b.vendor_id && a.ticket_date == b.ticket_date;
}

bool ReferenceExists(const std::map<int64_t, model::ReferenceEntity>& refs, std::optional<int64_t> id) {
  return !id || refs.contains(*id);
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Reference data
// ------------------------------------------------------------------

Result MemoryRepository::InsertReference(Transaction& t, model::ReferenceEntity& r) {
  auto& s = TX(t).Mutable();
  for (const auto& [_, existing] : s.references) {
    if (existing.category == r.category && existing.canonical_name == r.canonical_name) {
      return Result::Err(ErrorCode::AlreadyExists, "reference exists: " + r.canonical_name);
    }
  }
  r.id                = s.next_reference_id++;
  s.references[r.id] = r;
  return Result::Ok();
}

std::optional<model::ReferenceEntity> MemoryRepository::FindReference(Transaction& t, model::ReferenceCategory category, const std::string& name) {
  const auto& s = TX(t).View();
  for (const auto& [_, r] : s.references) {
    if (r.category == category && r.canonical_name == name) return r;
  }
  return std::nullopt;
}

std::vector<model::ReferenceEntity> MemoryRepository::ListReferences(Transaction& t) {
  const auto&                         s = TX(t).View();
  std::vector<model::ReferenceEntity> out;
  out.reserve(s.references.size());
  for (const auto& [_, r] : s.references) out.push_back(r);
  return out;
}

// ------------------------------------------------------------------
// Tickets
// ------------------------------------------------------------------

Result MemoryRepository::InsertTicket(Transaction& t, model::TruckTicket& r) {
  auto& s = TX(t).Mutable();

  if (!s.references.contains(r.job_id) || !s.references.contains(r.material_id) || !s.references.contains(r.ticket_type_id) ||
      !ReferenceExists(s.references, r.source_id) || !ReferenceExists(s.references, r.destination_id) || !ReferenceExists(s.references, r.vendor_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed");
  }

  if (s.references.at(r.material_id).RequiresManifest() && !r.review_required && (!r.manifest_number || !model::IsValidManifestNumber(*r.manifest_number))) {
    return Result::Err(ErrorCode::ConstraintViolation, "valid manifest required for regulated material");
  }

  for (const auto& [_, existing] : s.tickets) {
    if (SameTicketKey(existing, r)) {
      return Result::Err(ErrorCode::ConstraintViolation, "UNIQUE constraint failed: truck_ticket(ticket_number, vendor_id, ticket_date)");
    }
  }

  r.id             = s.next_ticket_id++;
  s.tickets[r.id] = r;
  return Result::Ok();
}

std::optional<model::TruckTicket> MemoryRepository::GetTicket(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.tickets.find(id);
  if (it == s.tickets.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TruckTicket> MemoryRepository::FindTicketsInWindow(Transaction& t, const std::string& ticket_number, std::optional<int64_t> vendor_id, const util::Date& from,
                                                                      const util::Date& to) {
  const auto&                     s = TX(t).View();
  std::vector<model::TruckTicket> out;
  for (const auto& [_, r] : s.tickets) {
    if (r.ticket_number == ticket_number && r.vendor_id == vendor_id && r.ticket_date >= from && r.ticket_date <= to) {
      out.push_back(r);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.ticket_date != b.ticket_date) return a.ticket_date < b.ticket_date;
    return a.id < b.id;
  });
  return out;
}

std::vector<model::TruckTicket> MemoryRepository::FindTicketsByManifest(Transaction& t, std::optional<int64_t> vendor_id, const util::Date& date, const std::string& manifest_number) {
  const auto&                     s = TX(t).View();
  std::vector<model::TruckTicket> out;
  for (const auto& [_, r] : s.tickets) {
    if (r.vendor_id == vendor_id && r.ticket_date == date && r.manifest_number == manifest_number) out.push_back(r);
  }
  return out;
}

std::vector<model::TruckTicket> MemoryRepository::ListTicketsForFile(Transaction& t, const std::string& file_id) {
  const auto&                     s = TX(t).View();
  std::vector<model::TruckTicket> out;
  for (const auto& [_, r] : s.tickets) {
    if (r.file_id == file_id) out.push_back(r);
  }
  return out;
}

Result MemoryRepository::DeleteFileResults(Transaction& t, const std::string& file_id, const std::string& request_guid) {
  auto& s = TX(t).Mutable();

  std::set<int64_t> removed;
  for (const auto& [id, ticket] : s.tickets) {
    if (ticket.file_id == file_id && ticket.request_guid == request_guid) removed.insert(id);
  }
  auto detach = [&](std::optional<int64_t>& duplicate_of) {
    if (duplicate_of && removed.contains(*duplicate_of)) duplicate_of.reset();
  };
  for (auto& [_, ticket] : s.tickets) detach(ticket.duplicate_of);
  for (auto& [_, review] : s.reviews) {
    if (review.provisional_ticket) detach(review.provisional_ticket->duplicate_of);
  }

  std::erase_if(s.tickets, [&](const auto& kv) { return removed.contains(kv.first); });
  std::erase_if(s.reviews, [&](const auto& kv) { return kv.second.file_id == file_id && kv.second.request_guid == request_guid; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Review queue
// ------------------------------------------------------------------

Result MemoryRepository::InsertReviewEntry(Transaction& t, model::ReviewQueueEntry& r) {
  auto& s         = TX(t).Mutable();
  r.id            = s.next_review_id++;
  s.reviews[r.id] = r;
  return Result::Ok();
}

std::optional<model::ReviewQueueEntry> MemoryRepository::GetReviewEntry(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.reviews.find(id);
  if (it == s.reviews.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ReviewQueueEntry> MemoryRepository::ListReviewEntries(Transaction& t, bool unresolved_only) {
  const auto&                          s = TX(t).View();
  std::vector<model::ReviewQueueEntry> out;
  for (const auto& [_, r] : s.reviews) {
    if (unresolved_only && r.resolved) continue;
    out.push_back(r);
  }
  return out;
}

Result MemoryRepository::MarkReviewResolved(Transaction& t, int64_t id, const std::string& resolved_by, util::TimePoint resolved_at) {
  auto& s  = TX(t).Mutable();
  auto  it = s.reviews.find(id);
  if (it == s.reviews.end()) return Result::Err(ErrorCode::NotFound, "review entry " + std::to_string(id));
  if (it->second.resolved) return Result::Err(ErrorCode::Conflict, "review entry already resolved");
  it->second.resolved    = true;
  it->second.resolved_by = resolved_by;
  it->second.resolved_at = resolved_at;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Processed-file ledger
// ------------------------------------------------------------------

Result MemoryRepository::RecordProcessedFile(Transaction& t, const model::ProcessedFileRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.processed_files.contains(r.file_hash)) return Result::Err(ErrorCode::AlreadyExists, "file hash already recorded");
  s.processed_files[r.file_hash] = r;
  return Result::Ok();
}

std::optional<model::ProcessedFileRecord> MemoryRepository::FindProcessedFile(Transaction& t, const std::string& file_hash) {
  const auto& s  = TX(t).View();
  auto        it = s.processed_files.find(file_hash);
  if (it == s.processed_files.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Processing runs
// ------------------------------------------------------------------

Result MemoryRepository::InsertRun(Transaction& t, const model::ProcessingRun& r) {
  auto& s = TX(t).Mutable();
  if (s.runs.contains(r.request_guid)) return Result::Err(ErrorCode::AlreadyExists, "run exists: " + r.request_guid);
  s.runs[r.request_guid] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateRun(Transaction& t, const model::ProcessingRun& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.runs.find(r.request_guid);
  if (it == s.runs.end()) return Result::Err(ErrorCode::NotFound, "run " + r.request_guid);
  it->second = r;
  return Result::Ok();
}

std::optional<model::ProcessingRun> MemoryRepository::GetRun(Transaction& t, const std::string& request_guid) {
  const auto& s  = TX(t).View();
  auto        it = s.runs.find(request_guid);
  if (it == s.runs.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ProcessingRun> MemoryRepository::ListRuns(Transaction& t, std::size_t limit) {
  const auto&                       s = TX(t).View();
  std::vector<model::ProcessingRun> out;
  for (const auto& [_, r] : s.runs) out.push_back(r);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.started_at > b.started_at; });
  if (out.size() > limit) out.resize(limit);
  return out;
}

} // namespace ticketflow::db::memory
