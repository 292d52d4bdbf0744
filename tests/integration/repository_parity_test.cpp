#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "tests/support/ledger_fixture.hpp"

#if ROSTER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if ROSTER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using roster::db::ClaimOrder;
using roster::db::ErrorCode;
using roster::db::OwnershipProbe;
using roster::db::Repository;
using roster::db::memory::MemoryRepository;
using roster::db::model::ClaimRecord;
using roster::db::model::DraftPickRecord;
using roster::db::model::ExpiryWindowRecord;
using roster::db::model::RosterAssignmentRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

RosterAssignmentRecord Assignment(const std::string& league_id, const std::string& team_id, const std::string& player_id) {
  RosterAssignmentRecord record;
  record.league_id      = league_id;
  record.team_id        = team_id;
  record.player_id      = player_id;
  record.acquired_at_ms = NowMs();
  return record;
}

ClaimRecord Claim(const std::string& id, const std::string& league_id, const std::string& team_id, uint32_t snapshot, uint64_t created_at_ms,
                  const std::string& player_id = {}) {
  ClaimRecord claim;
  claim.claim_id          = id;
  claim.league_id         = league_id;
  claim.team_id           = team_id;
  claim.player_id         = player_id.empty() ? id + "-player" : player_id;
  claim.priority_snapshot = snapshot;
  claim.created_at_ms     = created_at_ms;
  return claim;
}

std::vector<std::string> Ids(const std::vector<ClaimRecord>& claims) {
  std::vector<std::string> ids;
  for (const auto& claim : claims) ids.push_back(claim.claim_id);
  return ids;
}

void VerifyOwnershipIsExclusive(Repository& repo, const std::string& league) {
  roster::testing::SeedLeague(repo, league);
  roster::testing::SeedTeam(repo, league, league + "-A", "ua");
  roster::testing::SeedTeam(repo, league, league + "-B", "ub");

  auto tx = repo.Begin();
  assert(repo.InsertAssignment(*tx, Assignment(league, league + "-A", "P1")));
  assert(repo.InsertAssignment(*tx, Assignment(league, league + "-B", "P1")).code == ErrorCode::ConstraintViolation);
  tx->Rollback();

  tx = repo.Begin();
  assert(repo.InsertAssignment(*tx, Assignment(league, league + "-A", "P1")));
  assert(repo.InsertAssignment(*tx, Assignment(league, league + "-A", "P2")));
  assert(repo.CountAssignments(*tx, league, league + "-A") == 2);
  assert(repo.ProbeOwnership(*tx, league, "P1") == OwnershipProbe::kOwned);
  assert(repo.ProbeOwnership(*tx, league, "P3") == OwnershipProbe::kFree);

  assert(repo.DeleteAssignment(*tx, league, league + "-B", "P1").code == ErrorCode::NotFound);
  assert(repo.DeleteAssignment(*tx, league, league + "-A", "P1"));
  assert(!repo.GetAssignment(*tx, league, "P1").has_value());
  assert(repo.InsertAssignment(*tx, Assignment(league, league + "-B", "P1")));
  assert(repo.GetAssignment(*tx, league, "P1")->team_id == league + "-B");
  tx->Commit();

  tx                = repo.Begin();
  const auto roster = repo.ListAssignments(*tx, league, league + "-A");
  assert(roster.size() == 1);
  assert(roster[0].player_id == "P2");
  assert(repo.FindTeamByOwner(*tx, league, "ub")->team_id == league + "-B");
  assert(!repo.FindTeamByOwner(*tx, league, "nobody").has_value());
  tx->Commit();
}

void VerifyRollbackDiscardsWrites(Repository& repo, const std::string& league) {
  roster::testing::SeedLeague(repo, league);
  roster::testing::SeedTeam(repo, league, league + "-A", "ua");

  {
    auto tx = repo.Begin();
    assert(repo.InsertAssignment(*tx, Assignment(league, league + "-A", "P1")));

    roster::db::model::LedgerEntryRecord entry;
    entry.league_id     = league;
    entry.team_id       = league + "-A";
    entry.kind          = "ADD";
    entry.player_id     = "P1";
    entry.source        = "web";
    entry.created_at_ms = NowMs();
    assert(repo.AppendLedgerEntry(*tx, entry));
    tx->Rollback();
  }

  auto tx = repo.Begin();
  assert(!repo.GetAssignment(*tx, league, "P1").has_value());
  assert(repo.ListLedgerEntries(*tx, league).empty());
  tx->Commit();
}

void VerifyPriorityRotation(Repository& repo, const std::string& league) {
  roster::testing::SeedLeague(repo, league);
  roster::testing::SeedTeam(repo, league, league + "-A", "ua", 1);
  roster::testing::SeedTeam(repo, league, league + "-B", "ub", 2);
  roster::testing::SeedTeam(repo, league, league + "-C", "uc", 3);
  roster::testing::SeedTeam(repo, league, league + "-U", "uu");

  auto tx = repo.Begin();
  assert(repo.RotatePriorityToBack(*tx, league, league + "-A", 77));
  assert(repo.RotatePriorityToBack(*tx, league, league + "-U", 77).code == ErrorCode::NotFound);
  tx->Commit();

  tx           = repo.Begin();
  const auto o = repo.ListPriorities(*tx, league);
  assert(o.size() == 3);
  assert(o[0].team_id == league + "-B" && o[0].rank == 1);
  assert(o[1].team_id == league + "-C" && o[1].rank == 2);
  assert(o[2].team_id == league + "-A" && o[2].rank == 3);
  assert(repo.GetPriority(*tx, league, league + "-A")->updated_at_ms == 77);

  roster::db::model::PriorityRecord clash;
  clash.league_id = league;
  clash.team_id   = league + "-U";
  clash.rank      = 2;
  assert(repo.UpsertPriority(*tx, clash).code == ErrorCode::ConstraintViolation);
  tx->Rollback();
}

void VerifyClaimLifecycle(Repository& repo, const std::string& league) {
  roster::testing::SeedLeague(repo, league);
  roster::testing::SeedTeam(repo, league, league + "-A", "ua", 1);
  roster::testing::SeedTeam(repo, league, league + "-C", "uc", 2);
  roster::testing::SeedTeam(repo, league, league + "-U", "uu");

  auto tx = repo.Begin();
  assert(repo.InsertClaim(*tx, Claim(league + "-c1", league, league + "-C", 2, 100)));
  assert(repo.InsertClaim(*tx, Claim(league + "-c2", league, league + "-A", 1, 200)));
  assert(repo.InsertClaim(*tx, Claim(league + "-c3", league, league + "-A", 1, 150)));
  assert(repo.InsertClaim(*tx, Claim(league + "-c4", league, league + "-U", 3, 50)));
  assert(repo.InsertClaim(*tx, Claim(league + "-c4", league, league + "-U", 3, 50)).code == ErrorCode::AlreadyExists);
  tx->Rollback();

  tx = repo.Begin();
  assert(repo.InsertClaim(*tx, Claim(league + "-c1", league, league + "-C", 2, 100)));
  assert(repo.InsertClaim(*tx, Claim(league + "-c2", league, league + "-A", 1, 200)));
  assert(repo.InsertClaim(*tx, Claim(league + "-c3", league, league + "-A", 1, 150)));
  assert(repo.InsertClaim(*tx, Claim(league + "-c4", league, league + "-U", 3, 50)));
  tx->Commit();

  tx = repo.Begin();
  const std::vector<std::string> ascending{league + "-c3", league + "-c2", league + "-c1", league + "-c4"};
  const std::vector<std::string> descending{league + "-c4", league + "-c1", league + "-c3", league + "-c2"};
  assert(Ids(repo.SelectPendingClaims(*tx, league, ClaimOrder::kRankAscending, 10)) == ascending);
  assert(Ids(repo.SelectPendingClaims(*tx, league, ClaimOrder::kRankDescending, 10)) == descending);
  assert(repo.SelectPendingClaims(*tx, league, ClaimOrder::kRankAscending, 2).size() == 2);

  // Current rank wins over the snapshot taken at submission.
  assert(repo.RotatePriorityToBack(*tx, league, league + "-A", 1));
  assert(Ids(repo.SelectPendingClaims(*tx, league, ClaimOrder::kRankAscending, 1)).front() == league + "-c1");

  assert(repo.CountPendingClaims(*tx, league) == 4);
  assert(!repo.LastClaimProcessedAt(*tx, league).has_value());
  const auto leagues = repo.ListLeaguesWithPendingClaims(*tx);
  assert(std::find(leagues.begin(), leagues.end(), league) != leagues.end());

  assert(repo.LockPendingClaim(*tx, league + "-c1").has_value());
  assert(repo.ResolveClaim(*tx, league + "-c1", "successful", "", 900));
  assert(!repo.LockPendingClaim(*tx, league + "-c1").has_value());
  assert(repo.ResolveClaim(*tx, league + "-c1", "failed", "late", 901).code == ErrorCode::Conflict);
  assert(repo.ResolveClaim(*tx, league + "-missing", "failed", "", 901).code == ErrorCode::NotFound);
  assert(repo.ResolveClaim(*tx, league + "-c4", "failed", "Player already rostered", 950));
  tx->Commit();

  tx = repo.Begin();
  assert(repo.CountPendingClaims(*tx, league) == 2);
  assert(repo.LastClaimProcessedAt(*tx, league) == std::optional<uint64_t>(950));

  const auto failed = repo.GetClaim(*tx, league + "-c4");
  assert(failed->status == "failed");
  assert(failed->failure_reason == "Player already rostered");
  assert(failed->processed_at_ms == 950);

  roster::db::ClaimFilter filter;
  filter.league_id = league;
  filter.limit     = 10;
  assert(Ids(repo.ListClaims(*tx, filter)).front() == league + "-c2");
  filter.status  = "pending";
  filter.team_id = league + "-A";
  assert(repo.ListClaims(*tx, filter).size() == 2);
  tx->Commit();

  // A cancelled claim is not a processing run.
  tx = repo.Begin();
  assert(repo.ResolveClaim(*tx, league + "-c3", "cancelled", "Cancelled by requester", 990));
  assert(repo.LastClaimProcessedAt(*tx, league) == std::optional<uint64_t>(950));
  tx->Commit();

  // One pending claim per (team, player); resolved claims do not count.
  tx = repo.Begin();
  assert(repo.InsertClaim(*tx, Claim(league + "-c5", league, league + "-C", 2, 300, league + "-c1-player")));
  assert(repo.InsertClaim(*tx, Claim(league + "-c6", league, league + "-A", 1, 300, league + "-c3-player")));
  assert(repo.InsertClaim(*tx, Claim(league + "-c7", league, league + "-C", 2, 300, league + "-c2-player")));
  assert(repo.InsertClaim(*tx, Claim(league + "-c8", league, league + "-A", 1, 300, league + "-c2-player")).code == ErrorCode::AlreadyExists);
  tx->Rollback();
}

void VerifyExpiryWindows(Repository& repo, const std::string& league) {
  auto window = [&](const std::string& player, uint64_t released_at) {
    ExpiryWindowRecord record;
    record.league_id           = league;
    record.player_id           = player;
    record.released_at_ms      = released_at;
    record.released_by_team_id = league + "-A";
    return record;
  };

  auto tx = repo.Begin();
  assert(!repo.GetLatestExpiryWindow(*tx, league, "P1").has_value());
  assert(repo.OpenExpiryWindow(*tx, window("P1", 1000)));
  assert(repo.OpenExpiryWindow(*tx, window("P1", 2000)));
  assert(repo.OpenExpiryWindow(*tx, window("P2", 1500)));
  assert(repo.OpenExpiryWindow(*tx, window("P3", 5000)));
  tx->Commit();

  tx         = repo.Begin();
  auto first = repo.GetLatestExpiryWindow(*tx, league, "P1");
  assert(first->released_at_ms == 2000);
  assert(!first->cleared_at_ms.has_value());

  assert(repo.CloseLapsedExpiryWindows(*tx, league, 2000, 6000) == 2);
  assert(repo.GetLatestExpiryWindow(*tx, league, "P2")->cleared_at_ms == std::optional<uint64_t>(6000));
  assert(!repo.GetLatestExpiryWindow(*tx, league, "P3")->cleared_at_ms.has_value());

  assert(repo.CloseExpiryWindows(*tx, league, "P3", 6100));
  assert(repo.GetLatestExpiryWindow(*tx, league, "P3")->cleared_at_ms == std::optional<uint64_t>(6100));
  assert(repo.CloseLapsedExpiryWindows(*tx, league, 10000, 10000) == 0);
  tx->Commit();
}

void VerifyLineupAndDraftMirror(Repository& repo, const std::string& league) {
  roster::testing::SeedLeague(repo, league);
  roster::testing::SeedTeam(repo, league, league + "-A", "ua");
  const auto team = league + "-A";

  auto tx = repo.Begin();
  assert(!repo.LockLineup(*tx, league, team).has_value());
  assert(repo.RemoveFromLineup(*tx, league, team, "P1", 10));
  assert(repo.AddToLineupBench(*tx, league, team, "P1", 10));
  assert(repo.AddToLineupBench(*tx, league, team, "P2", 11));
  tx->Commit();

  tx          = repo.Begin();
  auto lineup = repo.LockLineup(*tx, league, team);
  assert(lineup.has_value());
  assert(lineup->bench.size() == 2);
  assert(repo.RemoveFromLineup(*tx, league, team, "P1", 12));
  lineup = repo.LockLineup(*tx, league, team);
  assert(lineup->bench == std::vector<std::string>{"P2"});
  assert(lineup->active.empty());

  assert(repo.NextDraftPickNumber(*tx, league) == 1);
  DraftPickRecord pick;
  pick.league_id    = league;
  pick.team_id      = team;
  pick.player_id    = "P2";
  pick.round_number = 999;
  pick.pick_number  = repo.NextDraftPickNumber(*tx, league);
  pick.picked_at_ms = 11;
  assert(repo.UpsertDraftPick(*tx, pick));
  assert(repo.NextDraftPickNumber(*tx, league) == 2);

  assert(repo.SoftDeleteDraftPick(*tx, league, team, "P2", 20));
  assert(repo.GetDraftPick(*tx, league, team, "P2")->deleted_at_ms == std::optional<uint64_t>(20));

  pick.picked_at_ms = 30;
  assert(repo.UpsertDraftPick(*tx, pick));
  const auto revived = repo.GetDraftPick(*tx, league, team, "P2");
  assert(!revived->deleted_at_ms.has_value());
  assert(revived->round_number == 999);
  tx->Commit();
}

void VerifyLeagueLocks(Repository& repo, const std::string& league) {
  auto held = repo.TryLockLeague(league);
  assert(held != nullptr);
  assert(repo.TryLockLeague(league) == nullptr);

  auto other = repo.TryLockLeague(league + "-other");
  assert(other != nullptr);

  held.reset();
  auto again = repo.TryLockLeague(league);
  assert(again != nullptr);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& league) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  roster::testing::SeedLeague(*repo, league, 15, 24, "reverse_standings", 600);
  roster::testing::SeedTeam(*repo, league, league + "-A", "ua", 1);
  {
    auto tx = repo->Begin();
    assert(repo->InsertAssignment(*tx, Assignment(league, league + "-A", "P1")));
    assert(repo->InsertClaim(*tx, Claim(league + "-durable", league, league + "-A", 1, 5)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx     = repo->Begin();
  auto stored = repo->GetLeague(*tx, league);
  assert(stored.has_value());
  assert(stored->max_roster_size == 15);
  assert(stored->cooldown_hours == 24);
  assert(stored->priority_policy == "reverse_standings");
  assert(stored->processing_minute_utc == 600);
  assert(repo->GetAssignment(*tx, league, "P1")->team_id == league + "-A");
  assert(repo->GetClaim(*tx, league + "-durable")->status == "pending");
  assert(repo->GetTeam(*tx, league + "-A")->owner_user_id == std::optional<std::string>("ua"));
  tx->Commit();
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

#if ROSTER_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("roster_ledger_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<roster::db::sqlite::SqliteDB>(db_path);
    for (const auto& sql : roster::db::sql::SqliteBootstrapSql()) {
      db->Exec(sql);
    }
    return std::make_shared<roster::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() { std::filesystem::remove(db_path); },
  };
}
#endif

#if ROSTER_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("ROSTER_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("ROSTER_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<roster::db::postgres::PgPool>(conninfo);
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      for (const auto& sql : roster::db::sql::PostgresBootstrapSql()) {
        tx.exec(sql);
      }
      tx.commit();
    }
    return std::make_shared<roster::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // League ids are unique per run so a shared Postgres database can be reused.
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  VerifyOwnershipIsExclusive(*repo, prefix + "-ownership");
  VerifyRollbackDiscardsWrites(*repo, prefix + "-rollback");
  VerifyPriorityRotation(*repo, prefix + "-priority");
  VerifyClaimLifecycle(*repo, prefix + "-claims");
  VerifyExpiryWindows(*repo, prefix + "-expiry");
  VerifyLineupAndDraftMirror(*repo, prefix + "-lineup");
  VerifyLeagueLocks(*repo, prefix + "-locks");

  repo.reset();
  VerifyRestartDurability(backend, prefix + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if ROSTER_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if ROSTER_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "roster_ledger_integration_repository_parity: pass\n";
  return 0;
}
