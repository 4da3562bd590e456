#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/time.hpp"

#if TICKETFLOW_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace {

using ticketflow::db::ErrorCode;
using ticketflow::db::Repository;
using ticketflow::db::memory::MemoryRepository;
using ticketflow::db::model::ProcessedFileRecord;
using ticketflow::db::model::ProcessingRun;
using ticketflow::db::model::QuantityUnit;
using ticketflow::db::model::ReferenceCategory;
using ticketflow::db::model::ReferenceEntity;
using ticketflow::db::model::ReviewQueueEntry;
using ticketflow::db::model::ReviewReason;
using ticketflow::db::model::RunStatus;
using ticketflow::db::model::Severity;
using ticketflow::db::model::TruckTicket;

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

struct Refs {
  int64_t job          = 0;
  int64_t material     = 0;
  int64_t regulated    = 0;
  int64_t vendor       = 0;
  int64_t other_vendor = 0;
  int64_t ticket_type  = 0;
};

ticketflow::util::Date D(const char* iso) {
  return *ticketflow::util::ParseIsoDate(iso);
}

int64_t InsertRef(Repository& repo, ticketflow::db::Transaction& tx, ReferenceCategory category, const std::string& name, bool requires_manifest = false) {
  ReferenceEntity ref{.category = category, .canonical_name = name};
  if (requires_manifest) ref.attributes["requires_manifest"] = "true";
  assert(repo.InsertReference(tx, ref));
  assert(ref.id != 0);
  return ref.id;
}

TruckTicket MakeTicket(const Refs& refs, const std::string& number, const char* date, const std::string& file_id, const std::string& request_guid) {
  TruckTicket ticket;
  ticket.ticket_number  = number;
  ticket.ticket_date    = D(date);
  ticket.quantity       = 18.5;
  ticket.quantity_unit  = QuantityUnit::Tons;
  ticket.job_id         = refs.job;
  ticket.material_id    = refs.material;
  ticket.vendor_id      = refs.vendor;
  ticket.ticket_type_id = refs.ticket_type;
  ticket.file_id        = file_id;
  ticket.file_page      = 1;
  ticket.file_hash      = "hash-" + file_id;
  ticket.request_guid   = request_guid;
  ticket.confidence     = 0.9;
  ticket.field_confidence["ticket_number"] = 0.95;
  ticket.field_confidence["ticket_date"]   = 0.85;
  ticket.created_at     = ticketflow::util::FromUnixMillis(1700000000000);
  return ticket;
}

Refs VerifyReferenceData(Repository& repo) {
  Refs refs;
  auto tx = repo.Begin();

  refs.job          = InsertRef(repo, *tx, ReferenceCategory::Job, "24-105");
  refs.material     = InsertRef(repo, *tx, ReferenceCategory::Material, "NON_CONTAMINATED");
  refs.regulated    = InsertRef(repo, *tx, ReferenceCategory::Material, "CLASS_2_CONTAMINATED", true);
  refs.vendor       = InsertRef(repo, *tx, ReferenceCategory::Vendor, "LDI_YARD");
  refs.other_vendor = InsertRef(repo, *tx, ReferenceCategory::Vendor, "POST_OAK_PIT");
  refs.ticket_type  = InsertRef(repo, *tx, ReferenceCategory::TicketType, "EXPORT");

  // same name in another category is a different entity
  const int64_t source = InsertRef(repo, *tx, ReferenceCategory::Source, "LDI_YARD");
  assert(source != refs.vendor);

  ReferenceEntity again{.category = ReferenceCategory::Vendor, .canonical_name = "LDI_YARD"};
  auto            dup = repo.InsertReference(*tx, again);
  assert(!dup);
  assert(dup.code == ErrorCode::AlreadyExists);

  auto regulated = repo.FindReference(*tx, ReferenceCategory::Material, "CLASS_2_CONTAMINATED");
  assert(regulated.has_value());
  assert(regulated->id == refs.regulated);
  assert(regulated->RequiresManifest());
  assert(!repo.FindReference(*tx, ReferenceCategory::Material, "LDI_YARD").has_value());

  assert(repo.ListReferences(*tx).size() == 7);
  tx->Commit();
  return refs;
}

void VerifyTicketInsertAndRead(Repository& repo, const Refs& refs) {
  auto tx = repo.Begin();

  auto ticket            = MakeTicket(refs, "12345678", "2024-10-17", "scans/a.pdf", "run-a");
  ticket.truck_number    = "T-42";
  ticket.destination_id  = refs.vendor;
  assert(repo.InsertTicket(*tx, ticket));
  assert(ticket.id != 0);

  auto read = repo.GetTicket(*tx, ticket.id);
  assert(read.has_value());
  assert(read->ticket_number == "12345678");
  assert(read->ticket_date == D("2024-10-17"));
  assert(read->quantity && *read->quantity == 18.5);
  assert(read->vendor_id == refs.vendor);
  assert(!read->source_id.has_value());
  assert(read->destination_id == refs.vendor);
  assert(read->truck_number == std::optional<std::string>("T-42"));
  assert(!read->manifest_number.has_value());
  assert(read->field_confidence.at("ticket_number") == 0.95);
  assert(ticketflow::util::ToUnixMillis(read->created_at) == 1700000000000);

  // the key is (number, vendor, date)
  auto same_key = MakeTicket(refs, "12345678", "2024-10-17", "scans/b.pdf", "run-a");
  auto conflict = repo.InsertTicket(*tx, same_key);
  assert(!conflict);
  assert(conflict.code == ErrorCode::ConstraintViolation);

  auto other_vendor      = MakeTicket(refs, "12345678", "2024-10-17", "scans/b.pdf", "run-a");
  other_vendor.vendor_id = refs.other_vendor;
  assert(repo.InsertTicket(*tx, other_vendor));

  auto no_vendor      = MakeTicket(refs, "12345678", "2024-10-17", "scans/b.pdf", "run-a");
  no_vendor.vendor_id = std::nullopt;
  assert(repo.InsertTicket(*tx, no_vendor));
  auto no_vendor_again      = MakeTicket(refs, "12345678", "2024-10-17", "scans/c.pdf", "run-a");
  no_vendor_again.vendor_id = std::nullopt;
  auto null_conflict        = repo.InsertTicket(*tx, no_vendor_again);
  assert(!null_conflict);
  assert(null_conflict.code == ErrorCode::ConstraintViolation);

  auto dangling        = MakeTicket(refs, "99999999", "2024-10-17", "scans/c.pdf", "run-a");
  dangling.material_id = 999999;
  assert(repo.InsertTicket(*tx, dangling).code == ErrorCode::ConstraintViolation);

  tx->Commit();
}

void VerifyManifestRule(Repository& repo, const Refs& refs) {
  auto tx = repo.Begin();

  auto missing        = MakeTicket(refs, "55500001", "2024-10-18", "scans/m.pdf", "run-m");
  missing.material_id = refs.regulated;
  auto refused        = repo.InsertTicket(*tx, missing);
  assert(!refused);
  assert(refused.code == ErrorCode::ConstraintViolation);

  for (const char* malformed : {"12-34", "MF12", "MF1234567890123456789", "MF 123456"}) {
    auto bad            = missing;
    bad.manifest_number = malformed;
    auto rejected       = repo.InsertTicket(*tx, bad);
    assert(!rejected);
    assert(rejected.code == ErrorCode::ConstraintViolation);
  }

  auto unregulated            = MakeTicket(refs, "55500003", "2024-10-18", "scans/m.pdf", "run-m");
  unregulated.manifest_number = "12-34";
  assert(repo.InsertTicket(*tx, unregulated));

  auto flagged            = missing;
  flagged.manifest_number = "12-34";
  flagged.review_required = true;
  assert(repo.InsertTicket(*tx, flagged));

  auto with_manifest            = MakeTicket(refs, "55500002", "2024-10-18", "scans/m.pdf", "run-m");
  with_manifest.material_id     = refs.regulated;
  with_manifest.manifest_number = "MF123456";
  assert(repo.InsertTicket(*tx, with_manifest));

  auto by_manifest = repo.FindTicketsByManifest(*tx, refs.vendor, D("2024-10-18"), "MF123456");
  assert(by_manifest.size() == 1);
  assert(by_manifest[0].ticket_number == "55500002");
  assert(repo.FindTicketsByManifest(*tx, refs.vendor, D("2024-10-19"), "MF123456").empty());
  assert(repo.FindTicketsByManifest(*tx, refs.other_vendor, D("2024-10-18"), "MF123456").empty());

  tx->Commit();
}

void VerifyWindowQuery(Repository& repo, const Refs& refs) {
  {
    auto tx = repo.Begin();
    for (const char* date : {"2024-12-01", "2024-06-01", "2024-09-15"}) {
      auto ticket = MakeTicket(refs, "77700000", date, "scans/w.pdf", "run-w");
      assert(repo.InsertTicket(*tx, ticket));
    }
    tx->Commit();
  }

  auto tx = repo.Begin();

  auto window = repo.FindTicketsInWindow(*tx, "77700000", refs.vendor, D("2024-06-01"), D("2024-12-01"));
  assert(window.size() == 3);
  assert(window[0].ticket_date == D("2024-06-01"));
  assert(window[1].ticket_date == D("2024-09-15"));
  assert(window[2].ticket_date == D("2024-12-01"));

  auto narrow = repo.FindTicketsInWindow(*tx, "77700000", refs.vendor, D("2024-06-02"), D("2024-11-30"));
  assert(narrow.size() == 1);

  assert(repo.FindTicketsInWindow(*tx, "77700000", refs.other_vendor, D("2024-01-01"), D("2024-12-31")).empty());
  assert(repo.FindTicketsInWindow(*tx, "77700000", std::nullopt, D("2024-01-01"), D("2024-12-31")).empty());

  auto nulls = repo.FindTicketsInWindow(*tx, "12345678", std::nullopt, D("2024-10-01"), D("2024-10-31"));
  assert(nulls.size() == 1);
  assert(!nulls[0].vendor_id.has_value());

  tx->Rollback();
}

ReviewQueueEntry MakeReview(const Refs& refs, const std::string& file_id, const std::string& request_guid) {
  ReviewQueueEntry entry;
  entry.file_id      = file_id;
  entry.file_page    = 2;
  entry.page_id      = file_id + "#page2";
  entry.request_guid = request_guid;
  entry.reason       = ReviewReason::MissingManifest;
  entry.severity     = Severity::Critical;
  entry.problems.push_back({.reason = ReviewReason::MissingManifest, .severity = Severity::Critical, .field = "manifest_number", .message = "manifest required"});
  entry.problems.push_back(
      {.reason = ReviewReason::MissingSource, .severity = Severity::Info, .field = "source", .message = "no source", .blocking = false});
  entry.detected_fields["ticket_number"] = "88800001";
  entry.suggested_fix.action             = "Enter manifest number";
  entry.suggested_fix.details["field"]   = "manifest_number";

  auto provisional            = MakeTicket(refs, "88800001", "2024-10-20", file_id, request_guid);
  provisional.material_id     = refs.regulated;
  provisional.review_required = true;
  entry.provisional_ticket    = provisional;
  entry.created_at            = ticketflow::util::FromUnixMillis(1700000001000);
  return entry;
}

void VerifyReviewQueue(Repository& repo, const Refs& refs) {
  auto tx = repo.Begin();

  auto entry = MakeReview(refs, "scans/r.pdf", "run-r");
  assert(repo.InsertReviewEntry(*tx, entry));
  assert(entry.id != 0);

  auto read = repo.GetReviewEntry(*tx, entry.id);
  assert(read.has_value());
  assert(read->page_id == "scans/r.pdf#page2");
  assert(read->reason == ReviewReason::MissingManifest);
  assert(read->severity == Severity::Critical);
  assert(read->problems.size() == 2);
  assert(read->problems[1].reason == ReviewReason::MissingSource);
  assert(!read->problems[1].blocking);
  assert(read->detected_fields.at("ticket_number") == "88800001");
  assert(read->suggested_fix.details.at("field") == "manifest_number");
  assert(read->provisional_ticket.has_value());
  assert(read->provisional_ticket->review_required);
  assert(read->provisional_ticket->ticket_date == D("2024-10-20"));
  assert(!read->resolved);

  assert(repo.ListReviewEntries(*tx, true).size() == 1);

  const auto resolved_at = ticketflow::util::FromUnixMillis(1700000002000);
  assert(repo.MarkReviewResolved(*tx, entry.id, "reviewer", resolved_at));
  assert(repo.MarkReviewResolved(*tx, entry.id, "reviewer", resolved_at).code == ErrorCode::Conflict);
  assert(repo.MarkReviewResolved(*tx, 424242, "reviewer", resolved_at).code == ErrorCode::NotFound);

  auto after = repo.GetReviewEntry(*tx, entry.id);
  assert(after->resolved);
  assert(after->resolved_by == "reviewer");
  assert(after->resolved_at && ticketflow::util::ToUnixMillis(*after->resolved_at) == 1700000002000);

  assert(repo.ListReviewEntries(*tx, true).empty());
  assert(repo.ListReviewEntries(*tx, false).size() == 1);

  tx->Commit();
}

void VerifyDeleteFileResults(Repository& repo, const Refs& refs) {
  {
    auto tx = repo.Begin();
    for (const char* number : {"66600001", "66600002"}) {
      auto ticket = MakeTicket(refs, number, "2024-10-21", "scans/d.pdf", "run-d");
      assert(repo.InsertTicket(*tx, ticket));
    }
    auto other_run = MakeTicket(refs, "66600003", "2024-10-21", "scans/d.pdf", "run-earlier");
    assert(repo.InsertTicket(*tx, other_run));

    auto review = MakeReview(refs, "scans/d.pdf", "run-d");
    assert(repo.InsertReviewEntry(*tx, review));
    tx->Commit();
  }

  // a page of another file flagged as a duplicate of a ticket about to be rolled back
  int64_t flagged_id = 0;
  {
    auto    tx     = repo.Begin();
    int64_t doomed = 0;
    for (const auto& t : repo.ListTicketsForFile(*tx, "scans/d.pdf")) {
      if (t.request_guid == "run-d") doomed = t.id;
    }
    assert(doomed != 0);

    auto flagged                             = MakeReview(refs, "scans/d2.pdf", "run-d");
    flagged.reason                           = ReviewReason::DuplicateTicket;
    flagged.provisional_ticket->duplicate_of = doomed;
    assert(repo.InsertReviewEntry(*tx, flagged));
    flagged_id = flagged.id;
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.ListTicketsForFile(*tx, "scans/d.pdf").size() == 3);
  const auto reviews_before = repo.ListReviewEntries(*tx, false).size();

  assert(repo.DeleteFileResults(*tx, "scans/d.pdf", "run-d"));

  auto left = repo.ListTicketsForFile(*tx, "scans/d.pdf");
  assert(left.size() == 1);
  assert(left[0].request_guid == "run-earlier");
  assert(repo.ListReviewEntries(*tx, false).size() == reviews_before - 1);

  auto detached = repo.GetReviewEntry(*tx, flagged_id);
  assert(detached && detached->provisional_ticket);
  assert(!detached->provisional_ticket->duplicate_of);
  assert(detached->provisional_ticket->ticket_number == "88800001");

  // nothing to delete is not an error
  assert(repo.DeleteFileResults(*tx, "scans/none.pdf", "run-d"));
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const Refs& refs) {
  int64_t id = 0;
  {
    auto tx     = repo.Begin();
    auto ticket = MakeTicket(refs, "44400001", "2024-10-22", "scans/rb.pdf", "run-rb");
    assert(repo.InsertTicket(*tx, ticket));
    id = ticket.id;
    tx->Rollback();
  }

  {
    auto tx     = repo.Begin();
    auto ticket = MakeTicket(refs, "44400002", "2024-10-22", "scans/rb.pdf", "run-rb");
    assert(repo.InsertTicket(*tx, ticket));
    // destroyed without Commit
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetTicket(*check_tx, id).has_value());
  assert(repo.ListTicketsForFile(*check_tx, "scans/rb.pdf").empty());
  check_tx->Commit();
}

void VerifyProcessedFiles(Repository& repo) {
  auto tx = repo.Begin();

  ProcessedFileRecord record{.file_hash    = "abc123",
                             .file_id      = "scans/p.pdf",
                             .request_guid = "run-p",
                             .processed_at = ticketflow::util::FromUnixMillis(1700000003000),
                             .ticket_ids   = {3, 5, 8},
                             .review_ids   = {}};
  assert(repo.RecordProcessedFile(*tx, record));
  assert(repo.RecordProcessedFile(*tx, record).code == ErrorCode::AlreadyExists);

  auto read = repo.FindProcessedFile(*tx, "abc123");
  assert(read.has_value());
  assert(read->file_id == "scans/p.pdf");
  assert(read->ticket_ids == std::vector<int64_t>({3, 5, 8}));
  assert(read->review_ids.empty());
  assert(ticketflow::util::ToUnixMillis(read->processed_at) == 1700000003000);
  assert(!repo.FindProcessedFile(*tx, "missing").has_value());

  tx->Commit();
}

void VerifyRuns(Repository& repo) {
  auto tx = repo.Begin();

  ProcessingRun older{.request_guid = "run-1", .processed_by = "ticketflow", .started_at = ticketflow::util::FromUnixMillis(1700000000000)};
  ProcessingRun newer{.request_guid = "run-2", .processed_by = "ticketflow", .started_at = ticketflow::util::FromUnixMillis(1700000500000)};
  assert(repo.InsertRun(*tx, older));
  assert(repo.InsertRun(*tx, newer));
  assert(repo.InsertRun(*tx, older).code == ErrorCode::AlreadyExists);

  newer.files_count   = 4;
  newer.pages_count   = 9;
  newer.ok_count      = 7;
  newer.review_count  = 2;
  newer.skipped_count = 1;
  newer.status        = RunStatus::Completed;
  newer.completed_at  = ticketflow::util::FromUnixMillis(1700000600000);
  assert(repo.UpdateRun(*tx, newer));

  ProcessingRun ghost{.request_guid = "run-ghost"};
  assert(repo.UpdateRun(*tx, ghost).code == ErrorCode::NotFound);

  auto read = repo.GetRun(*tx, "run-2");
  assert(read.has_value());
  assert(read->status == RunStatus::Completed);
  assert(read->pages_count == 9);
  assert(read->skipped_count == 1);
  assert(read->completed_at && ticketflow::util::ToUnixMillis(*read->completed_at) == 1700000600000);

  auto recent = repo.ListRuns(*tx, 10);
  assert(recent.size() == 2);
  assert(recent[0].request_guid == "run-2");
  assert(repo.ListRuns(*tx, 1).size() == 1);

  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto       repo = backend.make_repository();
  const auto refs = VerifyReferenceData(*repo);
  int64_t    ticket_id = 0;
  int64_t    review_id = 0;
  {
    auto tx     = repo->Begin();
    auto ticket = MakeTicket(refs, "33300001", "2024-10-23", "scans/durable.pdf", "run-durable");
    assert(repo->InsertTicket(*tx, ticket));
    ticket_id   = ticket.id;
    auto review = MakeReview(refs, "scans/durable.pdf", "run-durable");
    assert(repo->InsertReviewEntry(*tx, review));
    review_id = review.id;
    tx->Commit();
  }

  backend.restart(repo);

  {
    auto tx     = repo->Begin();
    auto ticket = repo->GetTicket(*tx, ticket_id);
    assert(ticket.has_value());
    assert(ticket->ticket_number == "33300001");
    auto review = repo->GetReviewEntry(*tx, review_id);
    assert(review.has_value());
    assert(review->provisional_ticket.has_value());
    assert(repo->FindReference(*tx, ReferenceCategory::Vendor, "LDI_YARD").has_value());
    tx->Commit();
  }

  repo.reset();
  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if TICKETFLOW_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto stamp   = ticketflow::util::ToUnixMillis(ticketflow::util::Now());
  const auto db_path = (std::filesystem::temp_directory_path() / ("ticketflow_integration_sqlite_" + std::to_string(stamp) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<ticketflow::db::sqlite::SqliteDB>(db_path);
    ticketflow::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<ticketflow::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto       repo = backend.make_repository();
    const auto refs = VerifyReferenceData(*repo);

    VerifyTicketInsertAndRead(*repo, refs);
    VerifyManifestRule(*repo, refs);
    VerifyWindowQuery(*repo, refs);
    VerifyReviewQueue(*repo, refs);
    VerifyDeleteFileResults(*repo, refs);
    VerifyRollbackBehavior(*repo, refs);
    VerifyProcessedFiles(*repo);
    VerifyRuns(*repo);
  }
  backend.cleanup();

  VerifyRestartDurability(backend);
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if TICKETFLOW_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "ticketflow_integration_repository_parity: pass\n";
  return 0;
}
