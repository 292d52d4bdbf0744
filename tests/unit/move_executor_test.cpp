#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ledger/move_executor.hpp"
#include "tests/support/ledger_fixture.hpp"

namespace {

using roster::db::memory::MemoryRepository;
using roster::ledger::LeagueDefaults;
using roster::ledger::MoveExecutor;
using roster::ledger::MoveRequest;
using roster::ledger::MoveStatus;
using roster::testing::ManualClock;

MoveRequest Move(const std::string& user, std::optional<std::string> release, std::optional<std::string> acquire) {
  MoveRequest request;
  request.league_id         = "L1";
  request.user_id           = user;
  request.release_player_id = std::move(release);
  request.acquire_player_id = std::move(acquire);
  return request;
}

std::vector<roster::db::model::FailedAttemptRecord> Failures(MemoryRepository& repo) {
  auto tx  = repo.Begin();
  auto out = repo.ListFailedAttempts(*tx, "L1");
  tx->Commit();
  return out;
}

std::vector<roster::db::model::LedgerEntryRecord> Ledger(MemoryRepository& repo) {
  auto tx  = repo.Begin();
  auto out = repo.ListLedgerEntries(*tx, "L1");
  tx->Commit();
  return out;
}

void TestAcquireFreeAgentWritesLedgerAndLineup() {
  auto        repository = std::make_shared<MemoryRepository>();
  ManualClock clock(roster::testing::kSaturdayMorningMs);
  roster::testing::SeedLeague(*repository, "L1");
  roster::testing::SeedTeam(*repository, "L1", "T1", "u1", 1);

  MoveExecutor executor(repository, LeagueDefaults{}, clock.Fn());
  const auto   result = executor.Execute(Move("u1", std::nullopt, "P1"));
  assert(result.ok());
  assert(result.team_id == "T1");
  assert(roster::testing::OwnerOf(*repository, "L1", "P1") == std::optional<std::string>("T1"));

  const auto entries = Ledger(*repository);
  assert(entries.size() == 1);
  assert(entries.front().kind == "ADD");
  assert(entries.front().player_id == "P1");
  assert(entries.front().source == "web");
  assert(entries.front().created_at_ms == clock.Now());

  auto tx     = repository->Begin();
  auto lineup = repository->LockLineup(*tx, "L1", "T1");
  assert(lineup.has_value());
  assert(lineup->bench.size() == 1 && lineup->bench.front() == "P1");
  auto pick = repository->GetDraftPick(*tx, "L1", "T1", "P1");
  assert(pick.has_value());
  assert(pick->round_number == 999);
  assert(!pick->deleted_at_ms.has_value());
  tx->Commit();

  assert(Failures(*repository).empty());
}

void TestDuplicateAcquireRollsBackRelease() {
  auto repository = std::make_shared<MemoryRepository>();
  roster::testing::SeedLeague(*repository, "L1");
  roster::testing::SeedTeam(*repository, "L1", "T1", "u1", 1);
  roster::testing::SeedTeam(*repository, "L1", "T2", "u2", 2);
  roster::testing::SeedRoster(*repository, "L1", "T1", {"P1"});
  roster::testing::SeedRoster(*repository, "L1", "T2", {"P2"});

  MoveExecutor executor(repository, LeagueDefaults{});
  const auto   result = executor.Execute(Move("u1", "P1", "P2"));
  assert(result.status == MoveStatus::kDuplicatePlayer);
  assert(!result.reason.empty());

  // The release of P1 happened before the failed acquire and must be undone.
  assert(roster::testing::OwnerOf(*repository, "L1", "P1") == std::optional<std::string>("T1"));
  assert(roster::testing::OwnerOf(*repository, "L1", "P2") == std::optional<std::string>("T2"));
  assert(Ledger(*repository).empty());

  auto tx = repository->Begin();
  assert(!repository->GetLatestExpiryWindow(*tx, "L1", "P1").has_value());
  tx->Commit();

  const auto failures = Failures(*repository);
  assert(failures.size() == 1);
  assert(failures.front().operation == "ADD_DUPLICATE");
  assert(failures.front().team_id == "T1");
  assert(failures.front().player_id == "P2");
}

void TestRosterCapOnlyAppliesWithoutRelease() {
  auto repository = std::make_shared<MemoryRepository>();
  roster::testing::SeedLeague(*repository, "L1", 2);
  roster::testing::SeedTeam(*repository, "L1", "T1", "u1", 1);
  roster::testing::SeedRoster(*repository, "L1", "T1", {"P1", "P2"});

  MoveExecutor executor(repository, LeagueDefaults{});

  const auto full = executor.Execute(Move("u1", std::nullopt, "P3"));
  assert(full.status == MoveStatus::kRosterFull);
  assert(!roster::testing::OwnerOf(*repository, "L1", "P3").has_value());
  assert(Failures(*repository).front().operation == "ROSTER_FULL");

  const auto swap = executor.Execute(Move("u1", "P1", "P3"));
  assert(swap.ok());
  assert(roster::testing::OwnerOf(*repository, "L1", "P3") == std::optional<std::string>("T1"));
  assert(!roster::testing::OwnerOf(*repository, "L1", "P1").has_value());

  const auto entries = Ledger(*repository);
  assert(entries.size() == 2);
  assert(entries[0].kind == "DROP" && entries[0].player_id == "P1");
  assert(entries[1].kind == "ADD" && entries[1].player_id == "P3");
}

void TestReleaseOfUnownedPlayerIsRejected() {
  auto repository = std::make_shared<MemoryRepository>();
  roster::testing::SeedLeague(*repository, "L1");
  roster::testing::SeedTeam(*repository, "L1", "T1", "u1", 1);
  roster::testing::SeedTeam(*repository, "L1", "T2", "u2", 2);
  roster::testing::SeedRoster(*repository, "L1", "T2", {"P1"});

  MoveExecutor executor(repository, LeagueDefaults{});
  constexpr int kAttempts = 5;
  for (int i = 0; i < kAttempts; ++i) {
    const auto result = executor.Execute(Move("u1", "P1", std::nullopt));
    assert(result.status == MoveStatus::kNotOwned);
    assert(roster::testing::OwnerOf(*repository, "L1", "P1") == std::optional<std::string>("T2"));
  }

  const auto failures = Failures(*repository);
  assert(failures.size() == kAttempts);
  for (const auto& failure : failures) {
    assert(failure.operation == "NOT_OWNED");
    assert(failure.team_id == "T1");
  }
  assert(Ledger(*repository).empty());
}

void TestValidationFailuresAreNotRecorded() {
  auto repository = std::make_shared<MemoryRepository>();
  roster::testing::SeedLeague(*repository, "L1");
  roster::testing::SeedTeam(*repository, "L1", "T1", "u1", 1);

  MoveExecutor executor(repository, LeagueDefaults{});
  assert(executor.Execute(Move("nobody", std::nullopt, "P1")).status == MoveStatus::kNoTeam);
  assert(executor.Execute(Move("u1", std::nullopt, std::nullopt)).status == MoveStatus::kError);
  assert(executor.Execute(Move("", std::nullopt, "P1")).status == MoveStatus::kError);
  assert(Failures(*repository).empty());
}

void TestDirectAddRespectsWaiverWindow() {
  auto        repository = std::make_shared<MemoryRepository>();
  ManualClock clock(roster::testing::kSaturdayMorningMs);
  roster::testing::SeedLeague(*repository, "L1", 22, 48);
  roster::testing::SeedTeam(*repository, "L1", "T1", "u1", 1);
  roster::testing::SeedTeam(*repository, "L1", "T2", "u2", 2);
  roster::testing::SeedRoster(*repository, "L1", "T1", {"P1"});

  MoveExecutor executor(repository, LeagueDefaults{}, clock.Fn());
  assert(executor.Execute(Move("u1", "P1", std::nullopt)).ok());

  clock.Advance(47 * roster::util::kMillisPerHour);
  const auto blocked = executor.Execute(Move("u2", std::nullopt, "P1"));
  assert(blocked.status == MoveStatus::kError);
  assert(blocked.reason.rfind("player is on waivers until ", 0) == 0);
  assert(Failures(*repository).back().operation == "ON_WAIVERS");

  clock.Advance(2 * roster::util::kMillisPerHour);
  assert(executor.Execute(Move("u2", std::nullopt, "P1")).ok());
  assert(roster::testing::OwnerOf(*repository, "L1", "P1") == std::optional<std::string>("T2"));

  auto tx     = repository->Begin();
  auto window = repository->GetLatestExpiryWindow(*tx, "L1", "P1");
  tx->Commit();
  assert(window.has_value());
  assert(window->cleared_at_ms.has_value());
}

void TestConcurrentAcquiresHaveExactlyOneWinner() {
  constexpr int kTeams = 16;

  auto repository = std::make_shared<MemoryRepository>();
  roster::testing::SeedLeague(*repository, "L1");
  for (int i = 0; i < kTeams; ++i) {
    roster::testing::SeedTeam(*repository, "L1", "T" + std::to_string(i), "u" + std::to_string(i), static_cast<uint32_t>(i + 1));
  }

  auto executor = std::make_shared<MoveExecutor>(repository, LeagueDefaults{});

  std::atomic<int>         successes{0};
  std::atomic<int>         duplicates{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kTeams; ++i) {
    threads.emplace_back([&, i] {
      const auto result = executor->Execute(Move("u" + std::to_string(i), std::nullopt, "STAR"));
      if (result.ok()) {
        ++successes;
      } else if (result.status == MoveStatus::kDuplicatePlayer) {
        ++duplicates;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(successes.load() == 1);
  assert(duplicates.load() == kTeams - 1);
  assert(Ledger(*repository).size() == 1);
  assert(Failures(*repository).size() == static_cast<std::size_t>(kTeams - 1));
}

void TestBatchCountsEachMoveIndependently() {
  auto repository = std::make_shared<MemoryRepository>();
  roster::testing::SeedLeague(*repository, "L1");
  roster::testing::SeedTeam(*repository, "L1", "T1", "u1", 1);
  roster::testing::SeedTeam(*repository, "L1", "T2", "u2", 2);

  MoveExecutor executor(repository, LeagueDefaults{});
  const auto   summary = executor.ExecuteBatch({Move("u1", std::nullopt, "P1"), Move("u2", std::nullopt, "P1"), Move("u2", std::nullopt, "P2")});
  assert(summary.results.size() == 3);
  assert(summary.succeeded == 2);
  assert(summary.failed == 1);
  assert(summary.results[1].status == MoveStatus::kDuplicatePlayer);
}

} // namespace

int main() {
  TestAcquireFreeAgentWritesLedgerAndLineup();
  TestDuplicateAcquireRollsBackRelease();
  TestRosterCapOnlyAppliesWithoutRelease();
  TestReleaseOfUnownedPlayerIsRejected();
  TestValidationFailuresAreNotRecorded();
  TestDirectAddRespectsWaiverWindow();
  TestConcurrentAcquiresHaveExactlyOneWinner();
  TestBatchCountsEachMoveIndependently();

  std::cout << "roster_ledger_unit_move_executor: pass\n";
  return 0;
}
