#include "pg_repository.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace roster::db::postgres {

using roster::db::ErrorCode;
using roster::db::Result;

namespace {

constexpr const char* kLeagueSelect =
    "SELECT league_id,name,max_roster_size,cooldown_hours,priority_policy,processing_minute_utc,created_at_ms FROM leagues ";
constexpr const char* kTeamSelect  = "SELECT team_id,league_id,owner_user_id,name,created_at_ms FROM teams ";
constexpr const char* kClaimSelect =
    "SELECT c.claim_id,c.league_id,c.team_id,c.player_id,c.release_player_id,c.priority_snapshot,c.status,c.created_at_ms,"
    "c.processed_at_ms,c.failure_reason FROM waiver_claims c ";

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

std::optional<uint64_t> OptU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<uint64_t>();
}

model::LeagueRecord ReadLeague(const pqxx::row& row) {
  model::LeagueRecord r;
  r.league_id             = row[0].c_str();
  r.name                  = row[1].c_str();
  r.max_roster_size       = row[2].as<uint32_t>();
  r.cooldown_hours        = row[3].as<uint32_t>();
  r.priority_policy       = row[4].c_str();
  r.processing_minute_utc = row[5].as<uint32_t>();
  r.created_at_ms         = row[6].as<uint64_t>();
  return r;
}

model::TeamRecord ReadTeam(const pqxx::row& row) {
  model::TeamRecord r;
  r.team_id       = row[0].c_str();
  r.league_id     = row[1].c_str();
  r.owner_user_id = OptText(row[2]);
  r.name          = row[3].c_str();
  r.created_at_ms = row[4].as<uint64_t>();
  return r;
}

model::ClaimRecord ReadClaim(const pqxx::row& row) {
  model::ClaimRecord r;
  r.claim_id          = row[0].c_str();
  r.league_id         = row[1].c_str();
  r.team_id           = row[2].c_str();
  r.player_id         = row[3].c_str();
  r.release_player_id = OptText(row[4]);
  r.priority_snapshot = row[5].as<uint32_t>();
  r.status            = row[6].c_str();
  r.created_at_ms     = row[7].as<uint64_t>();
  r.processed_at_ms   = OptU64(row[8]).value_or(0);
  r.failure_reason    = row[9].c_str();
  return r;
}

model::RosterAssignmentRecord ReadAssignment(const pqxx::row& row) {
  model::RosterAssignmentRecord r;
  r.league_id      = row[0].c_str();
  r.team_id        = row[1].c_str();
  r.player_id      = row[2].c_str();
  r.acquired_at_ms = row[3].as<uint64_t>();
  return r;
}

model::PriorityRecord ReadPriority(const pqxx::row& row) {
  model::PriorityRecord r;
  r.league_id     = row[0].c_str();
  r.team_id       = row[1].c_str();
  r.rank          = row[2].as<uint32_t>();
  r.updated_at_ms = row[3].as<uint64_t>();
  return r;
}

} // namespace

/*
  pg_try_advisory_xact_lock is released when its transaction ends, so
  the lock keeps a transaction (and its connection) open until the
  handle is destroyed.
*/
class PgLeagueLock final : public db::LeagueLock {
 public:
  PgLeagueLock(std::unique_ptr<PgTransaction> tx, std::string league_id) : tx_(std::move(tx)), league_id_(std::move(league_id)) {
  }

  ~PgLeagueLock() override {
    try {
      tx_->Commit();
    } catch (const std::exception& e) {
      ROSTER_LOG_WARN("failed to release league lock",
                      {observability::StringField("league_id", league_id_), observability::StringField("error", e.what())});
    }
  }

 private:
  std::unique_ptr<PgTransaction> tx_;
  std::string                    league_id_;
};

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::foreign_key_violation*>(&e)) {
    return Result::Err(ErrorCode::NotFound, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::transaction_rollback*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

std::unique_ptr<LeagueLock> PgRepository::TryLockLeague(const std::string& league_id) {
  auto tx  = std::make_unique<PgTransaction>(pool_);
  auto res = tx->Work().exec_params("SELECT pg_try_advisory_xact_lock(hashtext($1));", league_id);
  if (res.empty() || !res[0][0].as<bool>()) {
    tx->Rollback();
    return nullptr;
  }
  return std::make_unique<PgLeagueLock>(std::move(tx), league_id);
}

// ------------------------------------------------------------------
// Leagues / teams
// ------------------------------------------------------------------

Result PgRepository::UpsertLeague(Transaction& t, const model::LeagueRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO leagues(league_id,name,max_roster_size,cooldown_hours,priority_policy,processing_minute_utc,created_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7) ON CONFLICT(league_id) DO UPDATE SET name=EXCLUDED.name,max_roster_size=EXCLUDED.max_roster_size,"
        "cooldown_hours=EXCLUDED.cooldown_hours,priority_policy=EXCLUDED.priority_policy,processing_minute_utc=EXCLUDED.processing_minute_utc;",
        r.league_id, r.name, r.max_roster_size, r.cooldown_hours, r.priority_policy, r.processing_minute_utc, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LeagueRecord> PgRepository::GetLeague(Transaction& t, const std::string& league_id) {
  auto res = TX(t).Work().exec_params(std::string(kLeagueSelect) + "WHERE league_id=$1;", league_id);
  if (res.empty()) return std::nullopt;
  return ReadLeague(res[0]);
}

std::vector<model::LeagueRecord> PgRepository::ListLeagues(Transaction& t) {
  auto res = TX(t).Work().exec(std::string(kLeagueSelect) + "ORDER BY league_id;");

  std::vector<model::LeagueRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadLeague(row));
  return out;
}

Result PgRepository::UpsertTeam(Transaction& t, const model::TeamRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO teams(team_id,league_id,owner_user_id,name,created_at_ms) VALUES($1,$2,$3,$4,$5) "
        "ON CONFLICT(team_id) DO UPDATE SET league_id=EXCLUDED.league_id,owner_user_id=EXCLUDED.owner_user_id,name=EXCLUDED.name;",
        r.team_id, r.league_id, r.owner_user_id, r.name, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TeamRecord> PgRepository::GetTeam(Transaction& t, const std::string& team_id) {
  auto res = TX(t).Work().exec_params(std::string(kTeamSelect) + "WHERE team_id=$1;", team_id);
  if (res.empty()) return std::nullopt;
  return ReadTeam(res[0]);
}

std::optional<model::TeamRecord> PgRepository::FindTeamByOwner(Transaction& t, const std::string& league_id, const std::string& user_id) {
  auto res = TX(t).Work().exec_params(std::string(kTeamSelect) + "WHERE league_id=$1 AND owner_user_id=$2 ORDER BY created_at_ms, team_id LIMIT 1;",
                                      league_id, user_id);
  if (res.empty()) return std::nullopt;
  return ReadTeam(res[0]);
}

// ------------------------------------------------------------------
// Ownership
// ------------------------------------------------------------------

Result PgRepository::InsertAssignment(Transaction& t, const model::RosterAssignmentRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_assignment", r.league_id, r.team_id, r.player_id, r.acquired_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteAssignment(Transaction& t, const std::string& league_id, const std::string& team_id, const std::string& player_id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_assignment", league_id, team_id, player_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RosterAssignmentRecord> PgRepository::GetAssignment(Transaction& t, const std::string& league_id, const std::string& player_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT league_id,team_id,player_id,acquired_at_ms FROM roster_assignments WHERE league_id=$1 AND player_id=$2;", league_id, player_id);
  if (res.empty()) return std::nullopt;
  return ReadAssignment(res[0]);
}

std::vector<model::RosterAssignmentRecord> PgRepository::ListAssignments(Transaction& t, const std::string& league_id, const std::string& team_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT league_id,team_id,player_id,acquired_at_ms FROM roster_assignments WHERE league_id=$1 AND team_id=$2 "
      "ORDER BY acquired_at_ms, player_id;",
      league_id, team_id);

  std::vector<model::RosterAssignmentRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadAssignment(row));
  return out;
}

uint64_t PgRepository::CountAssignments(Transaction& t, const std::string& league_id, const std::string& team_id) {
  auto res = TX(t).Work().exec_prepared("count_assignments", league_id, team_id);
  return res.empty() ? 0 : res[0][0].as<uint64_t>();
}

OwnershipProbe PgRepository::ProbeOwnership(Transaction& t, const std::string& league_id, const std::string& player_id) {
  auto& work = TX(t).Work();
  if (!work.exec_prepared("probe_assignment_skip_locked", league_id, player_id).empty()) {
    return OwnershipProbe::kOwned;
  }
  // Nothing visible and unlocked: either free, or another transaction holds the row.
  if (!work.exec_prepared("probe_assignment", league_id, player_id).empty()) {
    return OwnershipProbe::kContended;
  }
  return OwnershipProbe::kFree;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result PgRepository::AppendLedgerEntry(Transaction& t, const model::LedgerEntryRecord& r) {
  try {
    TX(t).Work().exec_prepared("append_ledger_entry", r.league_id, r.team_id, r.user_id, r.kind, r.player_id, r.source, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::LedgerEntryRecord> PgRepository::ListLedgerEntries(Transaction& t, const std::string& league_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT entry_id,league_id,team_id,user_id,kind,player_id,source,created_at_ms FROM transaction_ledger WHERE league_id=$1 ORDER BY entry_id;",
      league_id);

  std::vector<model::LedgerEntryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::LedgerEntryRecord r;
    r.entry_id      = row[0].as<uint64_t>();
    r.league_id     = row[1].c_str();
    r.team_id       = row[2].c_str();
    r.user_id       = row[3].c_str();
    r.kind          = row[4].c_str();
    r.player_id     = row[5].c_str();
    r.source        = row[6].c_str();
    r.created_at_ms = row[7].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::InsertFailedAttempt(Transaction& t, const model::FailedAttemptRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO failed_transactions(id,league_id,team_id,user_id,operation,player_id,error_message,error_detail,attempted_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9);",
        r.id, r.league_id, r.team_id, r.user_id, r.operation, r.player_id, r.error_message, r.error_detail, r.attempted_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::FailedAttemptRecord> PgRepository::ListFailedAttempts(Transaction& t, const std::string& league_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,league_id,team_id,user_id,operation,player_id,error_message,error_detail,attempted_at_ms FROM failed_transactions "
      "WHERE league_id=$1 ORDER BY attempted_at_ms, id;",
      league_id);

  std::vector<model::FailedAttemptRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::FailedAttemptRecord r;
    r.id              = row[0].c_str();
    r.league_id       = row[1].c_str();
    r.team_id         = row[2].c_str();
    r.user_id         = row[3].c_str();
    r.operation       = row[4].c_str();
    r.player_id       = row[5].c_str();
    r.error_message   = row[6].c_str();
    r.error_detail    = row[7].c_str();
    r.attempted_at_ms = row[8].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Claims
// ------------------------------------------------------------------

Result PgRepository::InsertClaim(Transaction& t, const model::ClaimRecord& r) {
  try {
    std::optional<uint64_t> processed_at;
    if (r.processed_at_ms != 0) processed_at = r.processed_at_ms;
    TX(t).Work().exec_params(
        "INSERT INTO waiver_claims(claim_id,league_id,team_id,player_id,release_player_id,priority_snapshot,status,created_at_ms,processed_at_ms,"
        "failure_reason) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10);",
        r.claim_id, r.league_id, r.team_id, r.player_id, r.release_player_id, r.priority_snapshot, r.status, r.created_at_ms, processed_at,
        r.failure_reason);
    return Result::Ok();
  } catch (const pqxx::unique_violation& e) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ClaimRecord> PgRepository::GetClaim(Transaction& t, const std::string& claim_id) {
  auto res = TX(t).Work().exec_params(std::string(kClaimSelect) + "WHERE c.claim_id=$1;", claim_id);
  if (res.empty()) return std::nullopt;
  return ReadClaim(res[0]);
}

std::vector<model::ClaimRecord> PgRepository::ListClaims(Transaction& t, const ClaimFilter& filter) {
  auto res = TX(t).Work().exec_params(std::string(kClaimSelect) +
                                          "WHERE c.league_id=$1 AND ($2::text IS NULL OR c.team_id=$2) AND ($3::text IS NULL OR c.status=$3) "
                                          "ORDER BY c.created_at_ms DESC, c.claim_id DESC LIMIT $4;",
                                      filter.league_id, filter.team_id, filter.status, static_cast<uint64_t>(filter.limit));

  std::vector<model::ClaimRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadClaim(row));
  return out;
}

std::vector<model::ClaimRecord> PgRepository::SelectPendingClaims(Transaction& t, const std::string& league_id, ClaimOrder order, std::size_t limit) {
  const std::string direction = order == ClaimOrder::kRankAscending ? "ASC" : "DESC";
  auto              res       = TX(t).Work().exec_params(std::string(kClaimSelect) +
                                          "LEFT JOIN waiver_priority p ON p.league_id=c.league_id AND p.team_id=c.team_id "
                                          "WHERE c.league_id=$1 AND c.status='pending' "
                                          "ORDER BY COALESCE(p.priority, c.priority_snapshot) " +
                                          direction + ", c.created_at_ms ASC, c.claim_id ASC LIMIT $2;",
                                      league_id, static_cast<uint64_t>(limit));

  std::vector<model::ClaimRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadClaim(row));
  return out;
}

std::optional<model::ClaimRecord> PgRepository::LockPendingClaim(Transaction& t, const std::string& claim_id) {
  auto res = TX(t).Work().exec_prepared("lock_pending_claim", claim_id);
  if (res.empty()) return std::nullopt;
  return ReadClaim(res[0]);
}

Result PgRepository::ResolveClaim(Transaction& t, const std::string& claim_id, const std::string& status, const std::string& reason, uint64_t processed_at_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("resolve_claim", claim_id, status, reason, processed_at_ms);
    if (res.affected_rows() == 1) return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }

  auto existing = GetClaim(t, claim_id);
  if (!existing) return Result::Err(ErrorCode::NotFound);
  return Result::Err(ErrorCode::Conflict, "claim is " + existing->status);
}

std::vector<std::string> PgRepository::ListLeaguesWithPendingClaims(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT DISTINCT league_id FROM waiver_claims WHERE status='pending' ORDER BY league_id;");

  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) out.emplace_back(row[0].c_str());
  return out;
}

uint64_t PgRepository::CountPendingClaims(Transaction& t, const std::string& league_id) {
  auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM waiver_claims WHERE league_id=$1 AND status='pending';", league_id);
  return res.empty() ? 0 : res[0][0].as<uint64_t>();
}

std::optional<uint64_t> PgRepository::LastClaimProcessedAt(Transaction& t, const std::string& league_id) {
  auto res = TX(t).Work().exec_params("SELECT MAX(processed_at_ms) FROM waiver_claims WHERE league_id=$1 AND status IN ('successful','failed');", league_id);
  if (res.empty()) return std::nullopt;
  return OptU64(res[0][0]);
}

// ------------------------------------------------------------------
// Priority
// ------------------------------------------------------------------

Result PgRepository::UpsertPriority(Transaction& t, const model::PriorityRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO waiver_priority(league_id,team_id,priority,updated_at_ms) VALUES($1,$2,$3,$4) "
        "ON CONFLICT(league_id,team_id) DO UPDATE SET priority=EXCLUDED.priority,updated_at_ms=EXCLUDED.updated_at_ms;",
        r.league_id, r.team_id, r.rank, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PriorityRecord> PgRepository::GetPriority(Transaction& t, const std::string& league_id, const std::string& team_id) {
  auto res = TX(t).Work().exec_params("SELECT league_id,team_id,priority,updated_at_ms FROM waiver_priority WHERE league_id=$1 AND team_id=$2;",
                                      league_id, team_id);
  if (res.empty()) return std::nullopt;
  return ReadPriority(res[0]);
}

std::vector<model::PriorityRecord> PgRepository::ListPriorities(Transaction& t, const std::string& league_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT league_id,team_id,priority,updated_at_ms FROM waiver_priority WHERE league_id=$1 ORDER BY priority ASC;", league_id);

  std::vector<model::PriorityRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadPriority(row));
  return out;
}

/*
  UNIQUE(league_id, priority) is not deferrable, so the shift goes
  through negative ranks: park the team at 0, flip the ranks above it
  negative, flip them back one lower, then append the team.
*/
Result PgRepository::RotatePriorityToBack(Transaction& t, const std::string& league_id, const std::string& team_id, uint64_t updated_at_ms) {
  auto current = GetPriority(t, league_id, team_id);
  if (!current) return Result::Err(ErrorCode::NotFound, "team has no priority rank");

  try {
    auto& work = TX(t).Work();
    work.exec_params("UPDATE waiver_priority SET priority=0 WHERE league_id=$1 AND team_id=$2;", league_id, team_id);
    work.exec_params("UPDATE waiver_priority SET priority=-(priority-1),updated_at_ms=$2 WHERE league_id=$1 AND priority>$3;", league_id,
                     updated_at_ms, current->rank);
    work.exec_params("UPDATE waiver_priority SET priority=-priority WHERE league_id=$1 AND priority<0;", league_id);
    work.exec_params(
        "UPDATE waiver_priority SET priority=(SELECT COALESCE(MAX(priority),0)+1 FROM waiver_priority WHERE league_id=$1),updated_at_ms=$2 "
        "WHERE league_id=$1 AND team_id=$3;",
        league_id, updated_at_ms, team_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Expiry windows
// ------------------------------------------------------------------

Result PgRepository::OpenExpiryWindow(Transaction& t, const model::ExpiryWindowRecord& r) {
  auto closed = CloseExpiryWindows(t, r.league_id, r.player_id, r.released_at_ms);
  if (!closed) return closed;

  try {
    TX(t).Work().exec_params(
        "INSERT INTO player_waiver_status(league_id,player_id,released_at_ms,cleared_at_ms,released_by_team_id) VALUES($1,$2,$3,$4,$5);",
        r.league_id, r.player_id, r.released_at_ms, r.cleared_at_ms, r.released_by_team_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ExpiryWindowRecord> PgRepository::GetLatestExpiryWindow(Transaction& t, const std::string& league_id, const std::string& player_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT league_id,player_id,released_at_ms,cleared_at_ms,released_by_team_id FROM player_waiver_status "
      "WHERE league_id=$1 AND player_id=$2 ORDER BY released_at_ms DESC, id DESC LIMIT 1;",
      league_id, player_id);
  if (res.empty()) return std::nullopt;

  model::ExpiryWindowRecord r;
  r.league_id           = res[0][0].c_str();
  r.player_id           = res[0][1].c_str();
  r.released_at_ms      = res[0][2].as<uint64_t>();
  r.cleared_at_ms       = OptU64(res[0][3]);
  r.released_by_team_id = res[0][4].c_str();
  return r;
}

Result PgRepository::CloseExpiryWindows(Transaction& t, const std::string& league_id, const std::string& player_id, uint64_t cleared_at_ms) {
  try {
    TX(t).Work().exec_prepared("close_expiry_windows", league_id, player_id, cleared_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::CloseLapsedExpiryWindows(Transaction& t, const std::string& league_id, uint64_t released_before_ms, uint64_t cleared_at_ms) {
  auto res = TX(t).Work().exec_params(
      "UPDATE player_waiver_status SET cleared_at_ms=$3 WHERE league_id=$1 AND cleared_at_ms IS NULL AND released_at_ms<=$2;", league_id,
      released_before_ms, cleared_at_ms);
  return static_cast<uint64_t>(res.affected_rows());
}

// ------------------------------------------------------------------
// Lineup cache
// ------------------------------------------------------------------

std::optional<model::LineupRecord> PgRepository::LockLineup(Transaction& t, const std::string& league_id, const std::string& team_id) {
  auto& work = TX(t).Work();
  auto  head = work.exec_params("SELECT updated_at_ms FROM team_lineups WHERE league_id=$1 AND team_id=$2 FOR UPDATE;", league_id, team_id);
  if (head.empty()) return std::nullopt;

  model::LineupRecord lineup;
  lineup.league_id     = league_id;
  lineup.team_id       = team_id;
  lineup.updated_at_ms = head[0][0].as<uint64_t>();

  auto entries =
      work.exec_params("SELECT player_id,slot_group FROM team_lineup_entries WHERE league_id=$1 AND team_id=$2 ORDER BY position;", league_id, team_id);
  for (const auto& row : entries) {
    std::string player = row[0].c_str();
    std::string group  = row[1].c_str();
    if (group == "active") {
      lineup.active.push_back(std::move(player));
    } else if (group == "ir") {
      lineup.injured_reserve.push_back(std::move(player));
    } else {
      lineup.bench.push_back(std::move(player));
    }
  }
  return lineup;
}

// Lineup and mirror writes run under a savepoint: a failure there must
// leave the enclosing move transaction usable.

Result PgRepository::RemoveFromLineup(Transaction& t, const std::string& league_id, const std::string& team_id, const std::string& player_id, uint64_t updated_at_ms) {
  try {
    pqxx::subtransaction sub(TX(t).Work(), "lineup_remove");
    sub.exec_params("DELETE FROM team_lineup_entries WHERE league_id=$1 AND team_id=$2 AND player_id=$3;", league_id, team_id, player_id);
    sub.exec_params("UPDATE team_lineups SET updated_at_ms=$3 WHERE league_id=$1 AND team_id=$2;", league_id, team_id, updated_at_ms);
    sub.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::AddToLineupBench(Transaction& t, const std::string& league_id, const std::string& team_id, const std::string& player_id, uint64_t updated_at_ms) {
  try {
    pqxx::subtransaction sub(TX(t).Work(), "lineup_add");
    sub.exec_params(
        "INSERT INTO team_lineups(league_id,team_id,updated_at_ms) VALUES($1,$2,$3) "
        "ON CONFLICT(league_id,team_id) DO UPDATE SET updated_at_ms=EXCLUDED.updated_at_ms;",
        league_id, team_id, updated_at_ms);
    sub.exec_params(
        "INSERT INTO team_lineup_entries(league_id,team_id,player_id,slot_group,position) "
        "SELECT $1,$2,$3,'bench',COALESCE(MAX(position),0)+1 FROM team_lineup_entries WHERE league_id=$1 AND team_id=$2 "
        "ON CONFLICT(league_id,team_id,player_id) DO NOTHING;",
        league_id, team_id, player_id);
    sub.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Draft-pick mirror
// ------------------------------------------------------------------

Result PgRepository::UpsertDraftPick(Transaction& t, const model::DraftPickRecord& r) {
  try {
    pqxx::subtransaction sub(TX(t).Work(), "draft_pick_upsert");
    sub.exec_params(
        "INSERT INTO draft_picks(league_id,team_id,player_id,round_number,pick_number,picked_at_ms,deleted_at_ms) VALUES($1,$2,$3,$4,$5,$6,NULL) "
        "ON CONFLICT(league_id,team_id,player_id) DO UPDATE SET deleted_at_ms=NULL,picked_at_ms=EXCLUDED.picked_at_ms;",
        r.league_id, r.team_id, r.player_id, r.round_number, r.pick_number, r.picked_at_ms);
    sub.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::SoftDeleteDraftPick(Transaction& t, const std::string& league_id, const std::string& team_id, const std::string& player_id, uint64_t deleted_at_ms) {
  try {
    pqxx::subtransaction sub(TX(t).Work(), "draft_pick_delete");
    sub.exec_params("UPDATE draft_picks SET deleted_at_ms=$4 WHERE league_id=$1 AND team_id=$2 AND player_id=$3 AND deleted_at_ms IS NULL;", league_id,
                    team_id, player_id, deleted_at_ms);
    sub.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DraftPickRecord> PgRepository::GetDraftPick(Transaction& t, const std::string& league_id, const std::string& team_id, const std::string& player_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT league_id,team_id,player_id,round_number,pick_number,picked_at_ms,deleted_at_ms FROM draft_picks "
      "WHERE league_id=$1 AND team_id=$2 AND player_id=$3;",
      league_id, team_id, player_id);
  if (res.empty()) return std::nullopt;

  model::DraftPickRecord r;
  r.league_id     = res[0][0].c_str();
  r.team_id       = res[0][1].c_str();
  r.player_id     = res[0][2].c_str();
  r.round_number  = res[0][3].as<uint32_t>();
  r.pick_number   = res[0][4].as<uint32_t>();
  r.picked_at_ms  = res[0][5].as<uint64_t>();
  r.deleted_at_ms = OptU64(res[0][6]);
  return r;
}

uint32_t PgRepository::NextDraftPickNumber(Transaction& t, const std::string& league_id) {
  auto res = TX(t).Work().exec_params("SELECT COALESCE(MAX(pick_number),0)+1 FROM draft_picks WHERE league_id=$1;", league_id);
  return res.empty() ? 1 : res[0][0].as<uint32_t>();
}

} // namespace roster::db::postgres
