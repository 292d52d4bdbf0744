#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <variant>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ledger/priority_policy.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/ledger_fixture.hpp"

namespace {

using roster::db::ClaimOrder;
using roster::db::ErrorCode;
using roster::db::memory::MemoryRepository;
using namespace roster::ledger;

void TestParseAndName() {
  assert(std::holds_alternative<RotatingPolicy>(ParsePriorityPolicy("")));
  assert(std::holds_alternative<RotatingPolicy>(ParsePriorityPolicy("rotating")));
  assert(std::holds_alternative<ReverseStandingsPolicy>(ParsePriorityPolicy("reverse_standings")));
  assert(std::holds_alternative<BudgetBidPolicy>(ParsePriorityPolicy("budget_bid")));

  bool threw = false;
  try {
    ParsePriorityPolicy("faab");
  } catch (const roster::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  assert(PolicyName(ReverseStandingsPolicy{}) == "reverse_standings");
  assert(PolicyName(ParsePriorityPolicy(PolicyName(BudgetBidPolicy{}))) == "budget_bid");
}

void TestOrderingAndRotation() {
  assert(ClaimOrderFor(RotatingPolicy{}) == ClaimOrder::kRankAscending);
  assert(ClaimOrderFor(ReverseStandingsPolicy{}) == ClaimOrder::kRankDescending);
  assert(!ClaimOrderFor(BudgetBidPolicy{}).has_value());

  assert(RotatesOnSuccess(RotatingPolicy{}));
  assert(!RotatesOnSuccess(ReverseStandingsPolicy{}));
  assert(!RotatesOnSuccess(BudgetBidPolicy{}));
}

void TestRotateMiddleTeamKeepsRanksDense() {
  MemoryRepository repo;
  for (uint32_t i = 1; i <= 5; ++i) {
    roster::testing::SeedTeam(repo, "L1", "T" + std::to_string(i), "u" + std::to_string(i), i);
  }

  auto tx = repo.Begin();
  assert(repo.RotatePriorityToBack(*tx, "L1", "T2", 42));
  const auto ranks = repo.ListPriorities(*tx, "L1");
  tx->Commit();

  assert(ranks.size() == 5);
  const char* expected[] = {"T1", "T3", "T4", "T5", "T2"};
  for (uint32_t i = 0; i < 5; ++i) {
    assert(ranks[i].team_id == expected[i]);
    assert(ranks[i].rank == i + 1);
  }
  assert(ranks[4].updated_at_ms == 42);
}

void TestRotateUnrankedTeamIsNotFound() {
  MemoryRepository repo;
  roster::testing::SeedTeam(repo, "L1", "T1", "u1", 1);
  roster::testing::SeedTeam(repo, "L1", "T2", "u2");

  auto tx = repo.Begin();
  assert(repo.RotatePriorityToBack(*tx, "L1", "T2", 1).code == ErrorCode::NotFound);
  tx->Commit();
}

void TestDuplicateRankIsRejected() {
  MemoryRepository repo;
  roster::testing::SeedTeam(repo, "L1", "T1", "u1", 1);

  auto tx = repo.Begin();

  roster::db::model::PriorityRecord clash;
  clash.league_id = "L1";
  clash.team_id   = "T2";
  clash.rank      = 1;
  assert(repo.UpsertPriority(*tx, clash).code == ErrorCode::ConstraintViolation);
  tx->Rollback();
}

} // namespace

int main() {
  TestParseAndName();
  TestOrderingAndRotation();
  TestRotateMiddleTeamKeepsRanksDense();
  TestRotateUnrankedTeamIsNotFound();
  TestDuplicateRankIsRejected();

  std::cout << "roster_ledger_unit_priority_policy: pass\n";
  return 0;
}
