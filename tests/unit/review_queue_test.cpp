#include "internal/review/review_queue.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/reference/seed_data.hpp"
#include "internal/review/review_router.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace ticketflow;
using db::model::ReferenceCategory;
using db::model::ReviewReason;
using db::model::Severity;

int64_t RefId(db::Repository& repo, ReferenceCategory category, const std::string& name) {
  auto tx  = repo.Begin();
  auto ref = repo.FindReference(*tx, category, name);
  tx->Commit();
  assert(ref);
  return ref->id;
}

struct Fixture {
  std::shared_ptr<db::memory::MemoryRepository> repo = std::make_shared<db::memory::MemoryRepository>();
  review::ReviewQueue                           queue{repo};

  Fixture() {
    reference::SeedDefaults(*repo);
  }

  db::model::TruckTicket Ticket(const std::string& number) {
    db::model::TruckTicket t;
    t.ticket_number  = number;
    t.ticket_date    = *util::ParseIsoDate("2024-10-17");
    t.job_id         = RefId(*repo, ReferenceCategory::Job, "24-105");
    t.ticket_type_id = RefId(*repo, ReferenceCategory::TicketType, "EXPORT");
    t.material_id    = RefId(*repo, ReferenceCategory::Material, "CLASS_2_CONTAMINATED");
    t.vendor_id      = RefId(*repo, ReferenceCategory::Vendor, "WASTE_MANAGEMENT_LEWISVILLE");
    return t;
  }

  // Routes a missing-manifest page and stores the entry.
  int64_t Enqueue(const std::string& number) {
    auto                 ticket = Ticket(number);
    review::ReviewRouter router;
    auto                 decision = router.Route({"scans/wm.pdf", 1, "hash"}, "run-1",
                                                 {db::model::Problem{ReviewReason::MissingManifest, Severity::Critical, "manifest_number", "missing"}},
                                                 {{"ticket_number", number}}, ticket);
    assert(decision.entry);

    auto tx = repo->Begin();
    assert(repo->InsertReviewEntry(*tx, *decision.entry));
    tx->Commit();
    return decision.entry->id;
  }
};

void TestListAndGet() {
  Fixture f;
  const auto a = f.Enqueue("5012345");
  f.Enqueue("5012346");

  assert(f.queue.ListOpen().size() == 2);
  auto entry = f.queue.Get(a);
  assert(entry && entry->reason == ReviewReason::MissingManifest);
  assert(entry->provisional_ticket && entry->provisional_ticket->ticket_number == "5012345");
  assert(!f.queue.Get(999));
}

void TestResolveWithoutCorrection() {
  Fixture f;
  const auto id = f.Enqueue("5012345");

  assert(!f.queue.Resolve(id, "reviewer"));
  assert(f.queue.ListOpen().empty());
  assert(f.queue.ListAll().size() == 1);

  auto entry = f.queue.Get(id);
  assert(entry->resolved && entry->resolved_by == "reviewer" && entry->resolved_at);

  bool threw = false;
  try {
    f.queue.Resolve(id, "reviewer");
  } catch (const util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.queue.Resolve(404, "reviewer");
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestCorrectionMustCarryManifest() {
  Fixture f;
  const auto id = f.Enqueue("5012345");

  auto corrected = *f.queue.Get(id)->provisional_ticket;
  assert(corrected.review_required);

  bool threw = false;
  try {
    f.queue.Resolve(id, "reviewer", corrected);
  } catch (const util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(f.queue.ListOpen().size() == 1);

  corrected.manifest_number = "MF123456";
  auto ticket_id            = f.queue.Resolve(id, "reviewer", corrected);
  assert(ticket_id);

  auto tx     = f.repo->Begin();
  auto stored = f.repo->GetTicket(*tx, *ticket_id);
  tx->Commit();
  assert(stored && stored->manifest_number == std::optional<std::string>("MF123456"));
  assert(!stored->review_required);
  assert(stored->file_id == "scans/wm.pdf" && stored->request_guid == "run-1");
  assert(f.queue.ListOpen().empty());
}

void TestCorrectionCollidingWithCommittedTicket() {
  Fixture f;

  auto committed            = f.Ticket("5012345");
  committed.manifest_number = "MF000001";
  {
    auto tx = f.repo->Begin();
    assert(f.repo->InsertTicket(*tx, committed));
    tx->Commit();
  }

  const auto id             = f.Enqueue("5012345");
  auto       corrected      = *f.queue.Get(id)->provisional_ticket;
  corrected.manifest_number = "MF000002";

  bool threw = false;
  try {
    f.queue.Resolve(id, "reviewer", corrected);
  } catch (const util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);
  assert(!f.queue.Get(id)->resolved);
}

} // namespace

int main() {
  TestListAndGet();
  TestResolveWithoutCorrection();
  TestCorrectionMustCarryManifest();
  TestCorrectionCollidingWithCommittedTicket();

  std::cout << "ticketflow_unit_review_queue: pass\n";
  return 0;
}
