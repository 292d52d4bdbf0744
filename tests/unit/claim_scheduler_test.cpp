#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ledger/claim_book.hpp"
#include "internal/ledger/claim_processor.hpp"
#include "internal/ledger/move_executor.hpp"
#include "internal/scheduler/claim_scheduler.hpp"
#include "tests/support/ledger_fixture.hpp"

namespace {

using roster::db::memory::MemoryRepository;
using roster::ledger::ClaimBook;
using roster::ledger::ClaimProcessor;
using roster::ledger::ClaimRequest;
using roster::ledger::LeagueDefaults;
using roster::ledger::MoveExecutor;
using roster::scheduler::ClaimScheduler;
using roster::scheduler::ClaimSchedulerOptions;
using roster::testing::ManualClock;
using roster::util::kMillisPerHour;

// 08:00 and 10:00 UTC runs on the same Saturday.
constexpr uint64_t kEightAm = roster::testing::kSaturdayMorningMs + 2 * kMillisPerHour;

struct World {
  World()
      : clock(roster::testing::kSaturdayMorningMs),
        repository(std::make_shared<MemoryRepository>()),
        executor(std::make_shared<MoveExecutor>(repository, LeagueDefaults{}, clock.Fn())),
        claims(repository, executor, LeagueDefaults{}, clock.Fn()),
        processor(std::make_shared<ClaimProcessor>(repository, executor, LeagueDefaults{}, roster::ledger::ClaimProcessorOptions{}, clock.Fn())) {
    roster::testing::SeedLeague(*repository, "L1", 22, 48, "rotating", 8 * 60);
    roster::testing::SeedLeague(*repository, "L2", 22, 48, "rotating", 10 * 60);
    roster::testing::SeedTeam(*repository, "L1", "A", "u1", 1);
    roster::testing::SeedTeam(*repository, "L2", "B", "u1", 1);
  }

  std::string Submit(const std::string& league_id, const std::string& player_id) {
    ClaimRequest request;
    request.league_id = league_id;
    request.user_id   = "u1";
    request.player_id = player_id;
    return claims.SubmitClaim(request).claim_id;
  }

  std::string Status(const std::string& claim_id) {
    auto tx    = repository->Begin();
    auto claim = repository->GetClaim(*tx, claim_id);
    tx->Commit();
    assert(claim.has_value());
    return claim->status;
  }

  ManualClock                       clock;
  std::shared_ptr<MemoryRepository> repository;
  std::shared_ptr<MoveExecutor>     executor;
  ClaimBook                         claims;
  std::shared_ptr<ClaimProcessor>   processor;
};

void TestRunOnceProcessesOnlyDueLeagues() {
  World w;
  const auto first  = w.Submit("L1", "P1");
  const auto second = w.Submit("L2", "P1");

  ClaimScheduler scheduler(w.processor, ClaimSchedulerOptions{});
  assert(scheduler.RunOnce() == 0);

  w.clock.Set(kEightAm + 60 * 1000);
  assert(scheduler.RunOnce() == 1);
  assert(w.Status(first) == "successful");
  assert(w.Status(second) == "pending");

  // Already processed inside today's window.
  assert(scheduler.RunOnce() == 0);

  w.clock.Set(kEightAm + 2 * kMillisPerHour);
  assert(scheduler.RunOnce() == 1);
  assert(w.Status(second) == "successful");
}

void TestBackgroundWorkerRunsDueLeague() {
  World w;
  const auto claim_id = w.Submit("L1", "P1");
  w.clock.Set(kEightAm + 60 * 1000);

  ClaimSchedulerOptions options;
  options.poll_interval = std::chrono::seconds(1);
  ClaimScheduler scheduler(w.processor, options);
  scheduler.Start();
  scheduler.Start();

  for (int i = 0; i < 200 && w.Status(claim_id) == "pending"; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(25));
  }
  scheduler.Stop();
  scheduler.Stop();

  assert(w.Status(claim_id) == "successful");
}

} // namespace

int main() {
  TestRunOnceProcessesOnlyDueLeagues();
  TestBackgroundWorkerRunsDueLeague();

  std::cout << "roster_ledger_unit_claim_scheduler: pass\n";
  return 0;
}
