#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ledger/expiry_tracker.hpp"
#include "tests/support/ledger_fixture.hpp"

namespace {

using roster::db::memory::MemoryRepository;
using roster::ledger::ExpiryTracker;
using roster::ledger::LeagueSettings;
using roster::testing::ManualClock;
using roster::util::kMillisPerHour;

LeagueSettings Settings(uint32_t cooldown_hours) {
  LeagueSettings settings;
  settings.league_id      = "L1";
  settings.cooldown_hours = cooldown_hours;
  return settings;
}

void TestWindowLapsesAfterCooldown() {
  auto        repository = std::make_shared<MemoryRepository>();
  ManualClock clock(roster::testing::kSaturdayMorningMs);
  ExpiryTracker tracker(repository, clock.Fn());
  const auto    settings = Settings(48);

  auto tx = repository->Begin();
  assert(!tracker.IsOnCooldown(*tx, settings, "P1"));
  assert(!tracker.ClearTime(*tx, settings, "P1").has_value());

  assert(tracker.OpenWindow(*tx, "L1", "P1", "T1", clock.Now()));
  assert(tracker.IsOnCooldown(*tx, settings, "P1"));
  assert(tracker.ClearTime(*tx, settings, "P1") == clock.Now() + 48 * kMillisPerHour);
  tx->Commit();

  clock.Advance(48 * kMillisPerHour);
  tx = repository->Begin();
  assert(!tracker.IsOnCooldown(*tx, settings, "P1"));

  // The lapsed window was closed as a side effect.
  auto window = repository->GetLatestExpiryWindow(*tx, "L1", "P1");
  assert(window.has_value());
  assert(window->cleared_at_ms == clock.Now());
  assert(!tracker.ClearTime(*tx, settings, "P1").has_value());
  tx->Commit();
}

void TestReopenReplacesOpenWindow() {
  auto        repository = std::make_shared<MemoryRepository>();
  ManualClock clock(roster::testing::kSaturdayMorningMs);
  ExpiryTracker tracker(repository, clock.Fn());
  const auto    settings = Settings(24);

  auto tx = repository->Begin();
  assert(tracker.OpenWindow(*tx, "L1", "P1", "T1", clock.Now()));
  clock.Advance(10 * kMillisPerHour);
  assert(tracker.OpenWindow(*tx, "L1", "P1", "T2", clock.Now()));

  auto window = repository->GetLatestExpiryWindow(*tx, "L1", "P1");
  assert(window->released_by_team_id == "T2");
  assert(tracker.ClearTime(*tx, settings, "P1") == clock.Now() + 24 * kMillisPerHour);
  tx->Commit();
}

void TestCloseWindowsOnAcquire() {
  auto        repository = std::make_shared<MemoryRepository>();
  ManualClock clock(roster::testing::kSaturdayMorningMs);
  ExpiryTracker tracker(repository, clock.Fn());
  const auto    settings = Settings(48);

  auto tx = repository->Begin();
  assert(tracker.OpenWindow(*tx, "L1", "P1", "T1", clock.Now()));
  assert(tracker.CloseWindows(*tx, "L1", "P1", clock.Now() + 5));
  assert(!tracker.IsOnCooldown(*tx, settings, "P1"));
  tx->Commit();
}

void TestSweepOnlyClosesLapsedWindowsInLeague() {
  auto        repository = std::make_shared<MemoryRepository>();
  ManualClock clock(roster::testing::kSaturdayMorningMs);
  ExpiryTracker tracker(repository, clock.Fn());

  auto tx = repository->Begin();
  assert(tracker.OpenWindow(*tx, "L1", "OLD", "T1", clock.Now()));
  assert(tracker.OpenWindow(*tx, "L2", "OTHER", "T9", clock.Now()));
  clock.Advance(30 * kMillisPerHour);
  assert(tracker.OpenWindow(*tx, "L1", "NEW", "T1", clock.Now()));
  clock.Advance(20 * kMillisPerHour);

  assert(tracker.SweepLapsed(*tx, Settings(48)) == 1);
  assert(repository->GetLatestExpiryWindow(*tx, "L1", "OLD")->cleared_at_ms.has_value());
  assert(!repository->GetLatestExpiryWindow(*tx, "L1", "NEW")->cleared_at_ms.has_value());
  assert(!repository->GetLatestExpiryWindow(*tx, "L2", "OTHER")->cleared_at_ms.has_value());
  assert(tracker.SweepLapsed(*tx, Settings(48)) == 0);
  tx->Commit();
}

} // namespace

int main() {
  TestWindowLapsesAfterCooldown();
  TestReopenReplacesOpenWindow();
  TestCloseWindowsOnAcquire();
  TestSweepOnlyClosesLapsedWindowsInLeague();

  std::cout << "roster_ledger_unit_expiry_tracker: pass\n";
  return 0;
}
