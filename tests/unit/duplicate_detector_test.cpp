#include "internal/validate/duplicate_detector.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/reference/seed_data.hpp"

namespace {

using namespace ticketflow;
using db::model::ReferenceCategory;

util::Date D(const char* iso) {
  return *util::ParseIsoDate(iso);
}

int64_t RefId(db::Repository& repo, ReferenceCategory category, const std::string& name) {
  auto tx  = repo.Begin();
  auto ref = repo.FindReference(*tx, category, name);
  tx->Commit();
  assert(ref);
  return ref->id;
}

struct Fixture {
  std::shared_ptr<db::memory::MemoryRepository> repo = std::make_shared<db::memory::MemoryRepository>();

  Fixture() {
    reference::SeedDefaults(*repo);
  }

  db::model::TruckTicket Make(const std::string& number, const char* date, std::optional<std::string> vendor = std::string("LDI_YARD")) {
    db::model::TruckTicket t;
    t.ticket_number  = number;
    t.ticket_date    = D(date);
    t.job_id         = RefId(*repo, ReferenceCategory::Job, "24-105");
    t.ticket_type_id = RefId(*repo, ReferenceCategory::TicketType, "EXPORT");
    t.material_id    = RefId(*repo, ReferenceCategory::Material, "CLEAN_FILL");
    if (vendor) t.vendor_id = RefId(*repo, ReferenceCategory::Vendor, *vendor);
    t.file_id   = "ldi.pdf";
    t.file_page = 1;
    t.quantity  = 18.5;
    return t;
  }

  int64_t Commit(db::model::TruckTicket t) {
    auto tx = repo->Begin();
    assert(repo->InsertTicket(*tx, t));
    tx->Commit();
    return t.id;
  }
};

void TestDuplicateInsideWindow() {
  Fixture f;
  const auto original = f.Commit(f.Make("12345678", "2024-10-17"));

  validate::DuplicateDetector detector;
  auto                        candidate = f.Make("12345678", "2024-11-01");

  auto tx      = f.repo->Begin();
  auto problem = detector.Check(*f.repo, *tx, candidate);
  tx->Rollback();

  assert(problem);
  assert(problem->reason == db::model::ReviewReason::DuplicateTicket);
  assert(problem->severity == db::model::Severity::Warning);
  assert(problem->message.find("#12345678 2024-10-17") != std::string::npos);
  assert(candidate.duplicate_of == std::optional<int64_t>(original));
  assert(candidate.review_required);
}

void TestWindowEdges() {
  Fixture f;
  f.Commit(f.Make("555001", "2024-10-17"));

  validate::DuplicateDetector detector;
  assert(detector.WindowDays() == 120);

  auto at_edge = f.Make("555001", "2025-02-14"); // 120 days later
  auto beyond  = f.Make("555001", "2025-02-15");
  auto tx      = f.repo->Begin();
  assert(detector.FindPrior(*f.repo, *tx, at_edge));
  assert(!detector.FindPrior(*f.repo, *tx, beyond));
  tx->Rollback();

  validate::DuplicateDetector narrow(30);
  auto                        month_later = f.Make("555001", "2024-11-20");
  tx                                      = f.repo->Begin();
  assert(!narrow.FindPrior(*f.repo, *tx, month_later));
  tx->Rollback();

  validate::DuplicateDetector fallback(0);
  assert(fallback.WindowDays() == validate::kDefaultDuplicateWindowDays);
}

void TestLaterTicketIsNeverPrior() {
  Fixture f;
  f.Commit(f.Make("777001", "2024-11-01"));

  validate::DuplicateDetector detector;
  auto                        earlier = f.Make("777001", "2024-10-17");
  auto                        tx      = f.repo->Begin();
  assert(!detector.Check(*f.repo, *tx, earlier));
  tx->Rollback();
  assert(!earlier.duplicate_of);
}

void TestVendorIsPartOfTheKey() {
  Fixture f;
  f.Commit(f.Make("12345678", "2024-10-17", std::string("LDI_YARD")));

  validate::DuplicateDetector detector;
  auto                        other_vendor = f.Make("12345678", "2024-10-20", std::string("POST_OAK_PIT"));
  auto                        no_vendor    = f.Make("12345678", "2024-10-20", std::nullopt);

  auto tx = f.repo->Begin();
  assert(!detector.Check(*f.repo, *tx, other_vendor));
  assert(!detector.Check(*f.repo, *tx, no_vendor));
  tx->Rollback();

  // two vendor-less tickets do collide
  f.Commit(f.Make("12345678", "2024-10-18", std::nullopt));
  tx = f.repo->Begin();
  assert(detector.Check(*f.repo, *tx, no_vendor));
  tx->Rollback();
}

void TestEarliestMatchReported() {
  Fixture f;
  const auto first = f.Commit(f.Make("888001", "2024-09-01"));
  f.Commit(f.Make("888001", "2024-10-01"));

  validate::DuplicateDetector detector;
  auto                        candidate = f.Make("888001", "2024-10-15");
  auto                        tx        = f.repo->Begin();
  auto                        prior     = detector.FindPrior(*f.repo, *tx, candidate);
  tx->Rollback();
  assert(prior && prior->id == first);
}

void TestFileLevelCheck() {
  Fixture f;
  validate::DuplicateDetector detector;

  db::model::ProcessedFileRecord record;
  record.file_hash    = "ab12";
  record.file_id      = "batch/a.pdf";
  record.request_guid = "run-1";
  record.ticket_ids   = {1, 2};

  auto tx = f.repo->Begin();
  assert(!detector.CheckFile(*f.repo, *tx, "ab12"));
  assert(f.repo->RecordProcessedFile(*tx, record));
  auto found = detector.CheckFile(*f.repo, *tx, "ab12");
  assert(found && found->file_id == "batch/a.pdf" && found->ticket_ids.size() == 2);
  assert(!detector.CheckFile(*f.repo, *tx, ""));
  tx->Commit();
}

} // namespace

int main() {
  TestDuplicateInsideWindow();
  TestWindowEdges();
  TestLaterTicketIsNeverPrior();
  TestVendorIsPartOfTheKey();
  TestEarliestMatchReported();
  TestFileLevelCheck();

  std::cout << "ticketflow_unit_duplicate_detector: pass\n";
  return 0;
}
