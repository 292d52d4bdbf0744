#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ledger/ownership_ledger.hpp"
#include "tests/support/ledger_fixture.hpp"

namespace {

using roster::db::ErrorCode;
using roster::db::memory::MemoryRepository;
using roster::ledger::OwnershipLedger;

void TestSecondAcquireIsConstraintViolation() {
  auto repository = std::make_shared<MemoryRepository>();
  roster::testing::SeedLeague(*repository, "L1");
  OwnershipLedger ledger(repository);

  auto tx = repository->Begin();
  assert(ledger.Acquire(*tx, "L1", "T1", "P1", 10));

  const auto dup = ledger.Acquire(*tx, "L1", "T2", "P1", 11);
  assert(!dup);
  assert(dup.code == ErrorCode::ConstraintViolation);

  assert(ledger.OwnerOf(*tx, "L1", "P1") == std::optional<std::string>("T1"));
  tx->Commit();
}

void TestSamePlayerInDifferentLeaguesIsIndependent() {
  auto repository = std::make_shared<MemoryRepository>();
  OwnershipLedger ledger(repository);

  auto tx = repository->Begin();
  assert(ledger.Acquire(*tx, "L1", "T1", "P1", 10));
  assert(ledger.Acquire(*tx, "L2", "T9", "P1", 10));
  assert(ledger.OwnerOf(*tx, "L2", "P1") == std::optional<std::string>("T9"));
  tx->Commit();
}

void TestReleaseRequiresOwningTeam() {
  auto repository = std::make_shared<MemoryRepository>();
  roster::testing::SeedRoster(*repository, "L1", "T1", {"P1", "P2"});
  OwnershipLedger ledger(repository);

  auto tx = repository->Begin();
  assert(ledger.Release(*tx, "L1", "T2", "P1").code == ErrorCode::NotFound);
  assert(ledger.Release(*tx, "L1", "T1", "P9").code == ErrorCode::NotFound);

  assert(ledger.Release(*tx, "L1", "T1", "P1"));
  assert(!ledger.OwnerOf(*tx, "L1", "P1").has_value());
  assert(ledger.RosterSize(*tx, "L1", "T1") == 1);

  const auto roster = ledger.RosterOf(*tx, "L1", "T1");
  assert(roster.size() == 1);
  assert(roster.front() == "P2");
  tx->Commit();
}

void TestRolledBackAcquireLeavesNoOwner() {
  auto repository = std::make_shared<MemoryRepository>();
  OwnershipLedger ledger(repository);

  {
    auto tx = repository->Begin();
    assert(ledger.Acquire(*tx, "L1", "T1", "P1", 10));
    tx->Rollback();
  }

  auto tx = repository->Begin();
  assert(!ledger.OwnerOf(*tx, "L1", "P1").has_value());
  assert(ledger.RosterSize(*tx, "L1", "T1") == 0);
  tx->Commit();
}

} // namespace

int main() {
  TestSecondAcquireIsConstraintViolation();
  TestSamePlayerInDifferentLeaguesIsIndependent();
  TestReleaseRequiresOwningTeam();
  TestRolledBackAcquireLeavesNoOwner();

  std::cout << "roster_ledger_unit_ownership_ledger: pass\n";
  return 0;
}
