#include "review_queue.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/validate/manifest_validator.hpp"

namespace ticketflow::review {

ReviewQueue::ReviewQueue(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::vector<db::model::ReviewQueueEntry> ReviewQueue::ListOpen() {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListReviewEntries(*tx, true);
  tx->Commit();
  return rows;
}

std::vector<db::model::ReviewQueueEntry> ReviewQueue::ListAll() {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListReviewEntries(*tx, false);
  tx->Commit();
  return rows;
}

std::optional<db::model::ReviewQueueEntry> ReviewQueue::Get(int64_t entry_id) {
  auto tx  = repository_->Begin();
  auto row = repository_->GetReviewEntry(*tx, entry_id);
  tx->Commit();
  return row;
}

std::optional<int64_t> ReviewQueue::Resolve(int64_t entry_id, const std::string& resolved_by, std::optional<db::model::TruckTicket> corrected) {
  auto tx    = repository_->Begin();
  auto entry = repository_->GetReviewEntry(*tx, entry_id);
  if (!entry) throw util::NotFound("review entry " + std::to_string(entry_id));
  if (entry->resolved) throw util::InvalidState("review entry " + std::to_string(entry_id) + " already resolved");

  std::optional<int64_t> ticket_id;
  if (corrected) {
    std::optional<db::model::ReferenceEntity> material;
    for (auto& ref : repository_->ListReferences(*tx)) {
      if (ref.category == db::model::ReferenceCategory::Material && ref.id == corrected->material_id) {
        material = std::move(ref);
        break;
      }
    }
    if (!material) throw util::NotFound("material id " + std::to_string(corrected->material_id));

    corrected->review_required = false;
    corrected->duplicate_of.reset();
    validate::ManifestValidator validator;
    auto                        problems = validator.Validate(*corrected, *material);
    if (!problems.empty()) throw util::InvalidState("correction rejected: " + problems.front().message);

    if (corrected->request_guid.empty()) corrected->request_guid = entry->request_guid;
    if (corrected->file_id.empty()) corrected->file_id = entry->file_id;
    if (corrected->file_page == 0) corrected->file_page = entry->file_page;
    corrected->created_at = util::Now();

    auto r = repository_->InsertTicket(*tx, *corrected);
    if (r.code == db::ErrorCode::ConstraintViolation) throw util::AlreadyExists("corrected ticket conflicts with a committed ticket: " + r.message);
    util::ThrowIfDbError(r, "insert corrected ticket");
    ticket_id = corrected->id;
  }

  util::ThrowIfDbError(repository_->MarkReviewResolved(*tx, entry_id, resolved_by, util::Now()), "resolve review entry");
  tx->Commit();

  TICKETFLOW_LOG_INFO("review entry resolved", {observability::IntField("entry_id", entry_id), observability::StringField("resolved_by", resolved_by),
                                                observability::BoolField("ticket_committed", ticket_id.has_value())});
  return ticket_id;
}

} // namespace ticketflow::review
