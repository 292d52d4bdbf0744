#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ledger/claim_book.hpp"
#include "internal/ledger/claim_processor.hpp"
#include "internal/ledger/move_executor.hpp"
#include "tests/support/ledger_fixture.hpp"

namespace {

using roster::db::memory::MemoryRepository;
using roster::ledger::ClaimBook;
using roster::ledger::ClaimOutcome;
using roster::ledger::ClaimProcessor;
using roster::ledger::ClaimRequest;
using roster::ledger::ClaimStatus;
using roster::ledger::LeagueDefaults;
using roster::ledger::MoveExecutor;
using roster::testing::ManualClock;

struct Harness {
  explicit Harness(uint64_t start_ms = roster::testing::kSaturdayMorningMs)
      : clock(start_ms),
        repository(std::make_shared<MemoryRepository>()),
        executor(std::make_shared<MoveExecutor>(repository, LeagueDefaults{}, clock.Fn())),
        claims(repository, executor, LeagueDefaults{}, clock.Fn()),
        processor(repository, executor, LeagueDefaults{}, {}, clock.Fn()) {
  }

  // Claims get distinct creation times so ties break by submission order.
  std::string Submit(const std::string& user, const std::string& player, std::optional<std::string> release = std::nullopt) {
    clock.Advance(1000);
    ClaimRequest request;
    request.league_id         = "L1";
    request.user_id           = user;
    request.player_id         = player;
    request.release_player_id = std::move(release);
    return claims.SubmitClaim(request).claim_id;
  }

  std::vector<roster::db::model::PriorityRecord> Priorities() {
    auto tx  = repository->Begin();
    auto out = repository->ListPriorities(*tx, "L1");
    tx->Commit();
    return out;
  }

  roster::db::model::ClaimRecord Claim(const std::string& claim_id) {
    auto tx    = repository->Begin();
    auto claim = repository->GetClaim(*tx, claim_id);
    tx->Commit();
    assert(claim.has_value());
    return *claim;
  }

  ManualClock                       clock;
  std::shared_ptr<MemoryRepository> repository;
  std::shared_ptr<MoveExecutor>     executor;
  ClaimBook                         claims;
  ClaimProcessor                    processor;
};

void SeedThreeTeams(Harness& h, const std::string& policy = "rotating", uint32_t max_roster = 22) {
  roster::testing::SeedLeague(*h.repository, "L1", max_roster, 48, policy);
  roster::testing::SeedTeam(*h.repository, "L1", "T1", "u1", 1);
  roster::testing::SeedTeam(*h.repository, "L1", "T2", "u2", 2);
  roster::testing::SeedTeam(*h.repository, "L1", "T3", "u3", 3);
}

const ClaimOutcome& OutcomeFor(const std::vector<ClaimOutcome>& outcomes, const std::string& team_id) {
  for (const auto& outcome : outcomes) {
    if (outcome.team_id == team_id) return outcome;
  }
  assert(false && "no outcome for team");
  return outcomes.front();
}

void TestBestRankWinsAndRotatesToBack() {
  Harness h;
  SeedThreeTeams(h);

  h.Submit("u3", "P1");
  h.Submit("u2", "P1");
  h.Submit("u1", "P1");

  const auto outcomes = h.processor.ProcessClaims("L1");
  assert(outcomes.size() == 3);
  assert(outcomes[0].team_id == "T1");
  assert(outcomes[0].status == ClaimStatus::kSuccessful);
  assert(outcomes[1].team_id == "T2");
  assert(outcomes[1].status == ClaimStatus::kFailed);
  assert(outcomes[1].reason == "Player already rostered");
  assert(outcomes[2].team_id == "T3");
  assert(outcomes[2].status == ClaimStatus::kFailed);

  assert(roster::testing::OwnerOf(*h.repository, "L1", "P1") == std::optional<std::string>("T1"));

  const auto ranks = h.Priorities();
  assert(ranks.size() == 3);
  assert(ranks[0].team_id == "T2" && ranks[0].rank == 1);
  assert(ranks[1].team_id == "T3" && ranks[1].rank == 2);
  assert(ranks[2].team_id == "T1" && ranks[2].rank == 3);

  auto tx      = h.repository->Begin();
  auto entries = h.repository->ListLedgerEntries(*tx, "L1");
  tx->Commit();
  assert(entries.size() == 1);
  assert(entries.front().source == "waivers");
}

void TestOrderIsRankThenCreationTime() {
  Harness h;
  SeedThreeTeams(h);

  const auto c3 = h.Submit("u1", "P3");
  const auto c1 = h.Submit("u3", "P1");
  const auto c2 = h.Submit("u1", "P2");

  // The batch order is fixed when the run starts; T1 rotating to the back
  // after its first success does not reorder the remaining claims.
  const auto outcomes = h.processor.ProcessClaims("L1");
  assert(outcomes.size() == 3);
  assert(outcomes[0].claim_id == c3);
  assert(outcomes[1].claim_id == c2);
  assert(outcomes[2].claim_id == c1);
  for (const auto& outcome : outcomes) assert(outcome.status == ClaimStatus::kSuccessful);

  // T1 rotated twice, T3 once.
  const auto ranks = h.Priorities();
  assert(ranks[0].team_id == "T2" && ranks[0].rank == 1);
  assert(ranks[1].team_id == "T1" && ranks[1].rank == 2);
  assert(ranks[2].team_id == "T3" && ranks[2].rank == 3);
}

void TestReverseStandingsProcessesHighestRankFirstWithoutRotation() {
  Harness h;
  SeedThreeTeams(h, "reverse_standings");

  h.Submit("u1", "P1");
  h.Submit("u3", "P1");

  const auto outcomes = h.processor.ProcessClaims("L1");
  assert(outcomes.size() == 2);
  assert(OutcomeFor(outcomes, "T3").status == ClaimStatus::kSuccessful);
  assert(OutcomeFor(outcomes, "T1").status == ClaimStatus::kFailed);

  const auto ranks = h.Priorities();
  assert(ranks[0].team_id == "T1" && ranks[2].team_id == "T3");
}

void TestBudgetBidProcessesNothing() {
  Harness h;
  SeedThreeTeams(h, "budget_bid");

  const auto claim_id = h.Submit("u1", "P1");
  assert(h.processor.ProcessClaims("L1").empty());
  assert(h.Claim(claim_id).status == "pending");
}

void TestFullRosterFailsOnlyThatClaim() {
  Harness h;
  SeedThreeTeams(h, "rotating", 1);
  roster::testing::SeedRoster(*h.repository, "L1", "T1", {"P9"});

  const auto blocked = h.Submit("u1", "P1");
  const auto swap    = h.Submit("u1", "P2", std::string("P9"));
  const auto other   = h.Submit("u2", "P1");

  const auto outcomes = h.processor.ProcessClaims("L1");
  assert(outcomes.size() == 3);

  assert(h.Claim(blocked).status == "failed");
  assert(h.Claim(blocked).failure_reason == "Roster full");
  assert(h.Claim(swap).status == "successful");
  assert(h.Claim(other).status == "successful");

  assert(roster::testing::OwnerOf(*h.repository, "L1", "P2") == std::optional<std::string>("T1"));
  assert(!roster::testing::OwnerOf(*h.repository, "L1", "P9").has_value());
  assert(roster::testing::OwnerOf(*h.repository, "L1", "P1") == std::optional<std::string>("T2"));

  auto tx       = h.repository->Begin();
  auto failures = h.repository->ListFailedAttempts(*tx, "L1");
  tx->Commit();
  assert(failures.size() == 1);
  assert(failures.front().operation == "ROSTER_FULL");
}

void TestTeamWithoutOwnerFails() {
  Harness h;
  SeedThreeTeams(h);
  roster::testing::SeedTeam(*h.repository, "L1", "T4", std::nullopt, 4);

  roster::db::model::ClaimRecord orphan;
  orphan.claim_id          = "orphan-claim";
  orphan.league_id         = "L1";
  orphan.team_id           = "T4";
  orphan.player_id         = "P1";
  orphan.priority_snapshot = 4;
  orphan.created_at_ms     = h.clock.Now();
  {
    auto tx = h.repository->Begin();
    assert(h.repository->InsertClaim(*tx, orphan));
    tx->Commit();
  }

  const auto outcomes = h.processor.ProcessClaims("L1");
  assert(outcomes.size() == 1);
  assert(outcomes.front().status == ClaimStatus::kFailed);
  assert(outcomes.front().reason == "Team has no owner");
  assert(!roster::testing::OwnerOf(*h.repository, "L1", "P1").has_value());
}

void TestReleaseNoLongerOwnedFailsClaim() {
  Harness h;
  SeedThreeTeams(h);
  roster::testing::SeedRoster(*h.repository, "L1", "T1", {"P9"});

  const auto claim_id = h.Submit("u1", "P1", std::string("P9"));

  MoveExecutor direct(h.repository, LeagueDefaults{}, h.clock.Fn());
  roster::ledger::MoveRequest drop;
  drop.league_id         = "L1";
  drop.user_id           = "u1";
  drop.release_player_id = "P9";
  assert(direct.Execute(drop).ok());

  const auto outcomes = h.processor.ProcessClaims("L1");
  assert(outcomes.size() == 1);
  assert(outcomes.front().status == ClaimStatus::kFailed);
  assert(h.Claim(claim_id).status == "failed");
  assert(!roster::testing::OwnerOf(*h.repository, "L1", "P1").has_value());
}

void TestClaimIgnoresWaiverWindow() {
  Harness h;
  SeedThreeTeams(h);
  roster::testing::SeedRoster(*h.repository, "L1", "T3", {"P1"});

  roster::ledger::MoveRequest drop;
  drop.league_id         = "L1";
  drop.user_id           = "u3";
  drop.release_player_id = "P1";
  assert(h.executor->Execute(drop).ok());

  h.Submit("u2", "P1");
  const auto outcomes = h.processor.ProcessClaims("L1");
  assert(outcomes.size() == 1);
  assert(outcomes.front().status == ClaimStatus::kSuccessful);
  assert(roster::testing::OwnerOf(*h.repository, "L1", "P1") == std::optional<std::string>("T2"));
}

void TestConcurrentRunGetsNothing() {
  Harness h;
  SeedThreeTeams(h);
  const auto claim_id = h.Submit("u1", "P1");

  {
    auto held = h.repository->TryLockLeague("L1");
    assert(held != nullptr);
    assert(h.processor.ProcessClaims("L1").empty());
    assert(h.Claim(claim_id).status == "pending");
  }

  assert(h.processor.ProcessClaims("L1").size() == 1);
  assert(h.Claim(claim_id).status == "successful");
}

void TestCancelledClaimsAreSkipped() {
  Harness h;
  SeedThreeTeams(h);

  const auto cancelled = h.Submit("u1", "P1");
  const auto live      = h.Submit("u2", "P1");
  h.claims.CancelClaim(cancelled, "u1");

  const auto outcomes = h.processor.ProcessClaims("L1");
  assert(outcomes.size() == 1);
  assert(outcomes.front().claim_id == live);
  assert(h.Claim(cancelled).status == "cancelled");
  assert(roster::testing::OwnerOf(*h.repository, "L1", "P1") == std::optional<std::string>("T2"));

  // Rank unchanged for the cancelled team; only the winner rotated.
  const auto ranks = h.Priorities();
  assert(ranks[0].team_id == "T1");
  assert(ranks[2].team_id == "T2");
}

void TestBatchSizeLimitsRun() {
  Harness h;
  SeedThreeTeams(h);
  h.Submit("u1", "P1");
  h.Submit("u2", "P2");
  h.Submit("u3", "P3");

  assert(h.processor.ProcessClaims("L1", 2).size() == 2);
  assert(h.processor.ProcessClaims("L1", 2).size() == 1);
  assert(h.processor.ProcessClaims("L1", 2).empty());
}

void TestScheduleAndStatus() {
  Harness h;
  SeedThreeTeams(h);

  // 06:00 UTC; the league processes at 08:00.
  const uint64_t eight_am = roster::testing::kSaturdayMorningMs + 2 * roster::util::kMillisPerHour;
  assert(ClaimProcessor::NextProcessingAt(8 * 60, roster::testing::kSaturdayMorningMs) == eight_am);
  assert(ClaimProcessor::NextProcessingAt(8 * 60, eight_am) == eight_am + roster::util::kMillisPerDay);

  assert(!h.processor.ShouldProcessNow("L1"));
  h.Submit("u1", "P1");
  assert(!h.processor.ShouldProcessNow("L1"));

  h.clock.Set(eight_am + 60 * 1000);
  assert(h.processor.ShouldProcessNow("L1"));
  assert(h.processor.DueLeagues() == std::vector<std::string>{"L1"});

  auto status = h.processor.ProcessingStatus("L1");
  assert(status.size() == 1);
  assert(status.front().pending_claims == 1);
  assert(!status.front().last_processed_at_ms.has_value());
  assert(status.front().policy == "rotating");

  const auto run = h.processor.ProcessAllPending();
  assert(run.leagues.size() == 1);
  assert(run.leagues.front().outcomes.size() == 1);

  h.Submit("u2", "P2");
  assert(!h.processor.ShouldProcessNow("L1"));

  status = h.processor.ProcessingStatus();
  assert(status.size() == 1);
  assert(status.front().pending_claims == 1);
  assert(status.front().last_processed_at_ms.has_value());
  assert(status.front().next_processing_at_ms == eight_am + roster::util::kMillisPerDay);

  h.clock.Set(eight_am + 10 * roster::util::kMillisPerMinute);
  assert(!h.processor.ShouldProcessNow("L1"));
}

void TestCancellationDoesNotCountAsRun() {
  Harness h;
  SeedThreeTeams(h);

  const uint64_t eight_am = roster::testing::kSaturdayMorningMs + 2 * roster::util::kMillisPerHour;
  const auto     first    = h.Submit("u1", "P1");
  h.Submit("u2", "P2");

  h.clock.Set(eight_am + 10 * 1000);
  assert(h.processor.ShouldProcessNow("L1"));

  h.clock.Set(eight_am + 20 * 1000);
  h.claims.CancelClaim(first, "u1");

  for (uint64_t minute = 0; minute < 5; ++minute) {
    h.clock.Set(eight_am + 30 * 1000 + minute * roster::util::kMillisPerMinute);
    assert(h.processor.ShouldProcessNow("L1"));
  }

  const auto status = h.processor.ProcessingStatus("L1");
  assert(status.size() == 1);
  assert(status.front().pending_claims == 1);
  assert(!status.front().last_processed_at_ms.has_value());

  assert(h.processor.ProcessClaims("L1").size() == 1);
  assert(!h.processor.ShouldProcessNow("L1"));
}

void TestWindowSpanningMidnightStaysDue() {
  Harness h;
  roster::testing::SeedLeague(*h.repository, "L1", 22, 48, "rotating", 23 * 60 + 58);
  roster::testing::SeedTeam(*h.repository, "L1", "T1", "u1", 1);
  h.Submit("u1", "P1");

  const uint64_t midnight = roster::testing::kSaturdayMorningMs - 6 * roster::util::kMillisPerHour + roster::util::kMillisPerDay;

  h.clock.Set(midnight - roster::util::kMillisPerMinute);
  assert(h.processor.ShouldProcessNow("L1"));
  h.clock.Set(midnight + roster::util::kMillisPerMinute);
  assert(h.processor.ShouldProcessNow("L1"));
  h.clock.Set(midnight + 4 * roster::util::kMillisPerMinute);
  assert(!h.processor.ShouldProcessNow("L1"));

  // A run just before midnight covers the rest of that window.
  h.clock.Set(midnight - roster::util::kMillisPerMinute);
  assert(h.processor.ProcessClaims("L1").size() == 1);
  h.Submit("u1", "P2");
  h.clock.Set(midnight + roster::util::kMillisPerMinute);
  assert(!h.processor.ShouldProcessNow("L1"));
}

void TestSweepClosesLapsedWindows() {
  Harness h;
  SeedThreeTeams(h);
  roster::testing::SeedRoster(*h.repository, "L1", "T1", {"P1", "P2"});

  roster::ledger::MoveRequest drop;
  drop.league_id         = "L1";
  drop.user_id           = "u1";
  drop.release_player_id = "P1";
  assert(h.executor->Execute(drop).ok());

  h.clock.Advance(24 * roster::util::kMillisPerHour);
  drop.release_player_id = "P2";
  assert(h.executor->Execute(drop).ok());

  assert(h.processor.SweepExpiredWindows() == 0);
  h.clock.Advance(25 * roster::util::kMillisPerHour);
  assert(h.processor.SweepExpiredWindows() == 1);
  h.clock.Advance(24 * roster::util::kMillisPerHour);
  assert(h.processor.ProcessAllPending().expired_windows_cleared == 1);
}

void TestProcessAllPendingRunsEveryLeague() {
  Harness h;
  SeedThreeTeams(h);
  roster::testing::SeedLeague(*h.repository, "L2", 22, 48, "rotating");
  roster::testing::SeedTeam(*h.repository, "L2", "M1", "u1", 1);

  h.Submit("u2", "P1");
  ClaimRequest request;
  request.league_id = "L2";
  request.user_id   = "u1";
  request.player_id = "P9";
  h.claims.SubmitClaim(request);

  const auto run = h.processor.ProcessAllPending();
  assert(run.leagues.size() == 2);
  for (const auto& league : run.leagues) {
    assert(league.outcomes.size() == 1);
    assert(league.outcomes.front().status == ClaimStatus::kSuccessful);
  }
  assert(roster::testing::OwnerOf(*h.repository, "L1", "P1") == std::optional<std::string>("T2"));
  assert(roster::testing::OwnerOf(*h.repository, "L2", "P9") == std::optional<std::string>("M1"));

  assert(h.processor.ProcessAllPending().leagues.empty());
}

} // namespace

int main() {
  TestBestRankWinsAndRotatesToBack();
  TestOrderIsRankThenCreationTime();
  TestReverseStandingsProcessesHighestRankFirstWithoutRotation();
  TestBudgetBidProcessesNothing();
  TestFullRosterFailsOnlyThatClaim();
  TestTeamWithoutOwnerFails();
  TestReleaseNoLongerOwnedFailsClaim();
  TestClaimIgnoresWaiverWindow();
  TestConcurrentRunGetsNothing();
  TestCancelledClaimsAreSkipped();
  TestBatchSizeLimitsRun();
  TestScheduleAndStatus();
  TestCancellationDoesNotCountAsRun();
  TestWindowSpanningMidnightStaysDue();
  TestSweepClosesLapsedWindows();
  TestProcessAllPendingRunsEveryLeague();

  std::cout << "roster_ledger_unit_claim_processor: pass\n";
  return 0;
}
