#include "internal/processing/processing_run_ledger.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace ticketflow;
using db::model::RunStatus;

void TestLifecycle() {
  auto                            repo = std::make_shared<db::memory::MemoryRepository>();
  processing::ProcessingRunLedger ledger(repo);

  auto run = ledger.Start("operator@site");
  assert(run.request_guid.size() == 36);
  assert(run.status == RunStatus::InProgress);
  assert(!run.completed_at);

  ledger.RecordProgress(run.request_guid, {.files = 1, .pages = 3, .ok = 2, .reviews = 1});
  ledger.RecordProgress(run.request_guid, {.files = 1, .errors = 1});

  auto sealed = ledger.Seal(run.request_guid, RunStatus::Completed);
  assert(sealed.status == RunStatus::Completed);
  assert(sealed.completed_at);
  assert(sealed.files_count == 2 && sealed.pages_count == 3 && sealed.ok_count == 2);
  assert(sealed.error_count == 1 && sealed.review_count == 1 && sealed.skipped_count == 0);

  auto stored = ledger.Get(run.request_guid);
  assert(stored && stored->processed_by == "operator@site" && stored->status == RunStatus::Completed);
}

void TestSealedRunIsFrozen() {
  auto                            repo = std::make_shared<db::memory::MemoryRepository>();
  processing::ProcessingRunLedger ledger(repo);

  auto run = ledger.Start("cli", "run-fixed-guid");
  assert(run.request_guid == "run-fixed-guid");

  bool threw = false;
  try {
    ledger.Seal(run.request_guid, RunStatus::InProgress);
  } catch (const util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  ledger.Seal(run.request_guid, RunStatus::Failed);

  threw = false;
  try {
    ledger.RecordProgress(run.request_guid, {.files = 1});
  } catch (const util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    ledger.Seal(run.request_guid, RunStatus::Completed);
  } catch (const util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(ledger.Get(run.request_guid)->status == RunStatus::Failed);

  threw = false;
  try {
    ledger.RecordProgress("no-such-run", {.files = 1});
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    ledger.Start("cli", "run-fixed-guid");
  } catch (const util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);
}

void TestConcurrentProgressIsNotLost() {
  auto                            repo = std::make_shared<db::memory::MemoryRepository>();
  processing::ProcessingRunLedger ledger(repo);
  auto                            run = ledger.Start("cli");

  std::vector<std::thread> workers;
  for (int w = 0; w < 4; ++w) {
    workers.emplace_back([&] {
      for (int i = 0; i < 25; ++i) ledger.RecordProgress(run.request_guid, {.files = 1, .pages = 2});
    });
  }
  for (auto& t : workers) t.join();

  auto stored = ledger.Get(run.request_guid);
  assert(stored->files_count == 100);
  assert(stored->pages_count == 200);
}

void TestListRecent() {
  auto                            repo = std::make_shared<db::memory::MemoryRepository>();
  processing::ProcessingRunLedger ledger(repo);
  for (int i = 0; i < 3; ++i) ledger.Start("cli");
  assert(ledger.ListRecent(2).size() == 2);
  assert(ledger.ListRecent(10).size() == 3);
}

} // namespace

int main() {
  TestLifecycle();
  TestSealedRunIsFrozen();
  TestConcurrentProgressIsNotLost();
  TestListRecent();

  std::cout << "ticketflow_unit_processing_run_ledger: pass\n";
  return 0;
}
