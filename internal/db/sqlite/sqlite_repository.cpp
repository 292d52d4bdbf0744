#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <exception>
#include <functional>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace roster::db::sqlite {

using roster::db::ErrorCode;
using roster::db::Result;

namespace {

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColU64(st, col);
}

static uint32_t ColU32(sqlite3_stmt* st, int col) {
  return static_cast<uint32_t>(sqlite3_column_int64(st, col));
}

/*
  Owns one prepared statement. Reads throw on prepare/step failure;
  writes report through Result.
*/
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) : db_(db) {
    rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr);
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  explicit operator bool() const {
    return rc_ == SQLITE_OK;
  }
  int PrepareCode() const {
    return rc_;
  }
  sqlite3_stmt* get() const {
    return st_;
  }

  // Step for reads: true on a row, false when done, throws otherwise.
  bool Next() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db_));
  }

  void RequireReady() const {
    if (rc_ != SQLITE_OK) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db_));
  }

 private:
  sqlite3*      db_ = nullptr;
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_OK;
};

constexpr const char* kLeagueColumns = "league_id,name,max_roster_size,cooldown_hours,priority_policy,processing_minute_utc,created_at_ms";
constexpr const char* kTeamColumns   = "team_id,league_id,owner_user_id,name,created_at_ms";
constexpr const char* kClaimColumns =
    "c.claim_id,c.league_id,c.team_id,c.player_id,c.release_player_id,c.priority_snapshot,c.status,c.created_at_ms,c.processed_at_ms,c.failure_reason";

model::LeagueRecord ReadLeague(sqlite3_stmt* st) {
  model::LeagueRecord r;
  r.league_id             = ColText(st, 0);
  r.name                  = ColText(st, 1);
  r.max_roster_size       = ColU32(st, 2);
  r.cooldown_hours        = ColU32(st, 3);
  r.priority_policy       = ColText(st, 4);
  r.processing_minute_utc = ColU32(st, 5);
  r.created_at_ms         = ColU64(st, 6);
  return r;
}

model::TeamRecord ReadTeam(sqlite3_stmt* st) {
  model::TeamRecord r;
  r.team_id       = ColText(st, 0);
  r.league_id     = ColText(st, 1);
  r.owner_user_id = ColOptText(st, 2);
  r.name          = ColText(st, 3);
  r.created_at_ms = ColU64(st, 4);
  return r;
}

model::ClaimRecord ReadClaim(sqlite3_stmt* st) {
  model::ClaimRecord r;
  r.claim_id          = ColText(st, 0);
  r.league_id         = ColText(st, 1);
  r.team_id           = ColText(st, 2);
  r.player_id         = ColText(st, 3);
  r.release_player_id = ColOptText(st, 4);
  r.priority_snapshot = ColU32(st, 5);
  r.status            = ColText(st, 6);
  r.created_at_ms     = ColU64(st, 7);
  r.processed_at_ms   = ColOptU64(st, 8).value_or(0);
  r.failure_reason    = ColText(st, 9);
  return r;
}

model::RosterAssignmentRecord ReadAssignment(sqlite3_stmt* st) {
  model::RosterAssignmentRecord r;
  r.league_id      = ColText(st, 0);
  r.team_id        = ColText(st, 1);
  r.player_id      = ColText(st, 2);
  r.acquired_at_ms = ColU64(st, 3);
  return r;
}

} // namespace

/*
  Lease row in league_locks. Released by deleting the row it inserted.
*/
class SqliteLeagueLock final : public db::LeagueLock {
 public:
  SqliteLeagueLock(std::shared_ptr<SqliteDB> db, std::string league_id, std::string holder)
      : db_(std::move(db)), league_id_(std::move(league_id)), holder_(std::move(holder)) {
  }

  ~SqliteLeagueLock() override {
    try {
      SqliteTransaction tx(db_);
      Statement         st(tx.Handle(), "DELETE FROM league_locks WHERE league_id=? AND holder=?;");
      st.RequireReady();
      BindText(st.get(), 1, league_id_);
      BindText(st.get(), 2, holder_);
      st.Next();
      tx.Commit();
    } catch (const std::exception& e) {
      ROSTER_LOG_WARN("failed to release league lock",
                      {observability::StringField("league_id", league_id_), observability::StringField("error", e.what())});
    }
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  std::string               league_id_;
  std::string               holder_;
};

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db, uint64_t league_lock_stale_ms)
    : db_(std::move(db)), league_lock_stale_ms_(league_lock_stale_ms) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_FOREIGNKEY) {
        return Result::Err(ErrorCode::NotFound, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

namespace {

// Prepares, binds and steps a single write statement.
Result RunWrite(sqlite3* db, const std::string& sql, const std::function<void(sqlite3_stmt*)>& bind,
                Result (*translate)(sqlite3*, int)) {
  Statement st(db, sql);
  if (!st) return translate(db, st.PrepareCode());
  bind(st.get());
  return translate(db, sqlite3_step(st.get()));
}

} // namespace

std::unique_ptr<LeagueLock> SqliteRepository::TryLockLeague(const std::string& league_id) {
  const auto now    = util::NowMs();
  const auto holder = util::NewId();

  SqliteTransaction tx(db_);
  auto*             db = tx.Handle();

  auto res = RunWrite(
      db, "DELETE FROM league_locks WHERE league_id=? AND acquired_at_ms<?;",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, league_id);
        BindU64(st, 2, now > league_lock_stale_ms_ ? now - league_lock_stale_ms_ : 0);
      },
      &SqliteRepository::Translate);
  if (!res) throw std::runtime_error("league lock cleanup failed: " + res.message);

  res = RunWrite(
      db, "INSERT OR IGNORE INTO league_locks(league_id,holder,acquired_at_ms) VALUES(?,?,?);",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, league_id);
        BindText(st, 2, holder);
        BindU64(st, 3, now);
      },
      &SqliteRepository::Translate);
  if (!res) throw std::runtime_error("league lock insert failed: " + res.message);

  const bool acquired = sqlite3_changes(db) == 1;
  tx.Commit();

  if (!acquired) return nullptr;
  return std::make_unique<SqliteLeagueLock>(db_, league_id, holder);
}

// ------------------------------------------------------------------
// Leagues / teams
// ------------------------------------------------------------------

Result SqliteRepository::UpsertLeague(Transaction& t, const model::LeagueRecord& r) {
  return RunWrite(
      TX(t).Handle(),
      "INSERT INTO leagues(league_id,name,max_roster_size,cooldown_hours,priority_policy,processing_minute_utc,created_at_ms) "
      "VALUES(?,?,?,?,?,?,?) ON CONFLICT(league_id) DO UPDATE SET name=excluded.name,max_roster_size=excluded.max_roster_size,"
      "cooldown_hours=excluded.cooldown_hours,priority_policy=excluded.priority_policy,processing_minute_utc=excluded.processing_minute_utc;",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, r.league_id);
        BindText(st, 2, r.name);
        BindU64(st, 3, r.max_roster_size);
        BindU64(st, 4, r.cooldown_hours);
        BindText(st, 5, r.priority_policy);
        BindU64(st, 6, r.processing_minute_utc);
        BindU64(st, 7, r.created_at_ms);
      },
      &Translate);
}

std::optional<model::LeagueRecord> SqliteRepository::GetLeague(Transaction& t, const std::string& league_id) {
  Statement st(TX(t).Handle(), std::string("SELECT ") + kLeagueColumns + " FROM leagues WHERE league_id=?;");
  st.RequireReady();
  BindText(st.get(), 1, league_id);
  if (!st.Next()) return std::nullopt;
  return ReadLeague(st.get());
}

std::vector<model::LeagueRecord> SqliteRepository::ListLeagues(Transaction& t) {
  Statement st(TX(t).Handle(), std::string("SELECT ") + kLeagueColumns + " FROM leagues ORDER BY league_id;");
  st.RequireReady();
  std::vector<model::LeagueRecord> out;
  while (st.Next()) out.push_back(ReadLeague(st.get()));
  return out;
}

Result SqliteRepository::UpsertTeam(Transaction& t, const model::TeamRecord& r) {
  return RunWrite(
      TX(t).Handle(),
      "INSERT INTO teams(team_id,league_id,owner_user_id,name,created_at_ms) VALUES(?,?,?,?,?) "
      "ON CONFLICT(team_id) DO UPDATE SET league_id=excluded.league_id,owner_user_id=excluded.owner_user_id,name=excluded.name;",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, r.team_id);
        BindText(st, 2, r.league_id);
        BindOptText(st, 3, r.owner_user_id);
        BindText(st, 4, r.name);
        BindU64(st, 5, r.created_at_ms);
      },
      &Translate);
}

std::optional<model::TeamRecord> SqliteRepository::GetTeam(Transaction& t, const std::string& team_id) {
  Statement st(TX(t).Handle(), std::string("SELECT ") + kTeamColumns + " FROM teams WHERE team_id=?;");
  st.RequireReady();
  BindText(st.get(), 1, team_id);
  if (!st.Next()) return std::nullopt;
  return ReadTeam(st.get());
}

std::optional<model::TeamRecord> SqliteRepository::FindTeamByOwner(Transaction& t, const std::string& league_id, const std::string& user_id) {
  Statement st(TX(t).Handle(),
               std::string("SELECT ") + kTeamColumns + " FROM teams WHERE league_id=? AND owner_user_id=? ORDER BY created_at_ms, team_id LIMIT 1;");
  st.RequireReady();
  BindText(st.get(), 1, league_id);
  BindText(st.get(), 2, user_id);
  if (!st.Next()) return std::nullopt;
  return ReadTeam(st.get());
}

// ------------------------------------------------------------------
// Ownership
// ------------------------------------------------------------------

Result SqliteRepository::InsertAssignment(Transaction& t, const model::RosterAssignmentRecord& r) {
  return RunWrite(
      TX(t).Handle(), "INSERT INTO roster_assignments(league_id,team_id,player_id,acquired_at_ms) VALUES(?,?,?,?);",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, r.league_id);
        BindText(st, 2, r.team_id);
        BindText(st, 3, r.player_id);
        BindU64(st, 4, r.acquired_at_ms);
      },
      &Translate);
}

Result SqliteRepository::DeleteAssignment(Transaction& t, const std::string& league_id, const std::string& team_id, const std::string& player_id) {
  auto* db  = TX(t).Handle();
  auto  res = RunWrite(
      db, "DELETE FROM roster_assignments WHERE league_id=? AND team_id=? AND player_id=?;",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, league_id);
        BindText(st, 2, team_id);
        BindText(st, 3, player_id);
      },
      &Translate);
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::optional<model::RosterAssignmentRecord> SqliteRepository::GetAssignment(Transaction& t, const std::string& league_id, const std::string& player_id) {
  Statement st(TX(t).Handle(), "SELECT league_id,team_id,player_id,acquired_at_ms FROM roster_assignments WHERE league_id=? AND player_id=?;");
  st.RequireReady();
  BindText(st.get(), 1, league_id);
  BindText(st.get(), 2, player_id);
  if (!st.Next()) return std::nullopt;
  return ReadAssignment(st.get());
}

std::vector<model::RosterAssignmentRecord> SqliteRepository::ListAssignments(Transaction& t, const std::string& league_id, const std::string& team_id) {
  Statement st(TX(t).Handle(),
               "SELECT league_id,team_id,player_id,acquired_at_ms FROM roster_assignments WHERE league_id=? AND team_id=? "
               "ORDER BY acquired_at_ms, player_id;");
  st.RequireReady();
  BindText(st.get(), 1, league_id);
  BindText(st.get(), 2, team_id);
  std::vector<model::RosterAssignmentRecord> out;
  while (st.Next()) out.push_back(ReadAssignment(st.get()));
  return out;
}

uint64_t SqliteRepository::CountAssignments(Transaction& t, const std::string& league_id, const std::string& team_id) {
  Statement st(TX(t).Handle(), "SELECT COUNT(*) FROM roster_assignments WHERE league_id=? AND team_id=?;");
  st.RequireReady();
  BindText(st.get(), 1, league_id);
  BindText(st.get(), 2, team_id);
  return st.Next() ? ColU64(st.get(), 0) : 0;
}

OwnershipProbe SqliteRepository::ProbeOwnership(Transaction& t, const std::string& league_id, const std::string& player_id) {
  // BEGIN IMMEDIATE already excludes every other writer.
  Statement st(TX(t).Handle(), "SELECT 1 FROM roster_assignments WHERE league_id=? AND player_id=?;");
  st.RequireReady();
  BindText(st.get(), 1, league_id);
  BindText(st.get(), 2, player_id);
  return st.Next() ? OwnershipProbe::kOwned : OwnershipProbe::kFree;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result SqliteRepository::AppendLedgerEntry(Transaction& t, const model::LedgerEntryRecord& r) {
  return RunWrite(
      TX(t).Handle(), "INSERT INTO transaction_ledger(league_id,team_id,user_id,kind,player_id,source,created_at_ms) VALUES(?,?,?,?,?,?,?);",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, r.league_id);
        BindText(st, 2, r.team_id);
        BindText(st, 3, r.user_id);
        BindText(st, 4, r.kind);
        BindText(st, 5, r.player_id);
        BindText(st, 6, r.source);
        BindU64(st, 7, r.created_at_ms);
      },
      &Translate);
}

std::vector<model::LedgerEntryRecord> SqliteRepository::ListLedgerEntries(Transaction& t, const std::string& league_id) {
  Statement st(TX(t).Handle(),
               "SELECT entry_id,league_id,team_id,user_id,kind,player_id,source,created_at_ms FROM transaction_ledger WHERE league_id=? ORDER BY entry_id;");
  st.RequireReady();
  BindText(st.get(), 1, league_id);

  std::vector<model::LedgerEntryRecord> out;
  while (st.Next()) {
    model::LedgerEntryRecord r;
    r.entry_id      = ColU64(st.get(), 0);
    r.league_id     = ColText(st.get(), 1);
    r.team_id       = ColText(st.get(), 2);
    r.user_id       = ColText(st.get(), 3);
    r.kind          = ColText(st.get(), 4);
    r.player_id     = ColText(st.get(), 5);
    r.source        = ColText(st.get(), 6);
    r.created_at_ms = ColU64(st.get(), 7);
    out.push_back(std::move(r));
  }
  return out;
}

Result SqliteRepository::InsertFailedAttempt(Transaction& t, const model::FailedAttemptRecord& r) {
  return RunWrite(
      TX(t).Handle(),
      "INSERT INTO failed_transactions(id,league_id,team_id,user_id,operation,player_id,error_message,error_detail,attempted_at_ms) "
      "VALUES(?,?,?,?,?,?,?,?,?);",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, r.id);
        BindText(st, 2, r.league_id);
        BindText(st, 3, r.team_id);
        BindText(st, 4, r.user_id);
        BindText(st, 5, r.operation);
        BindText(st, 6, r.player_id);
        BindText(st, 7, r.error_message);
        BindText(st, 8, r.error_detail);
        BindU64(st, 9, r.attempted_at_ms);
      },
      &Translate);
}

std::vector<model::FailedAttemptRecord> SqliteRepository::ListFailedAttempts(Transaction& t, const std::string& league_id) {
  Statement st(TX(t).Handle(),
               "SELECT id,league_id,team_id,user_id,operation,player_id,error_message,error_detail,attempted_at_ms FROM failed_transactions "
               "WHERE league_id=? ORDER BY attempted_at_ms, rowid;");
  st.RequireReady();
  BindText(st.get(), 1, league_id);

  std::vector<model::FailedAttemptRecord> out;
  while (st.Next()) {
    model::FailedAttemptRecord r;
    r.id              = ColText(st.get(), 0);
    r.league_id       = ColText(st.get(), 1);
    r.team_id         = ColText(st.get(), 2);
    r.user_id         = ColText(st.get(), 3);
    r.operation       = ColText(st.get(), 4);
    r.player_id       = ColText(st.get(), 5);
    r.error_message   = ColText(st.get(), 6);
    r.error_detail    = ColText(st.get(), 7);
    r.attempted_at_ms = ColU64(st.get(), 8);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Claims
// ------------------------------------------------------------------

Result SqliteRepository::InsertClaim(Transaction& t, const model::ClaimRecord& r) {
  auto res = RunWrite(
      TX(t).Handle(),
      "INSERT INTO waiver_claims(claim_id,league_id,team_id,player_id,release_player_id,priority_snapshot,status,created_at_ms,processed_at_ms,failure_reason) "
      "VALUES(?,?,?,?,?,?,?,?,?,?);",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, r.claim_id);
        BindText(st, 2, r.league_id);
        BindText(st, 3, r.team_id);
        BindText(st, 4, r.player_id);
        BindOptText(st, 5, r.release_player_id);
        BindU64(st, 6, r.priority_snapshot);
        BindText(st, 7, r.status);
        BindU64(st, 8, r.created_at_ms);
        BindOptU64(st, 9, r.processed_at_ms == 0 ? std::nullopt : std::optional<uint64_t>(r.processed_at_ms));
        BindText(st, 10, r.failure_reason);
      },
      &Translate);
  if (res.code == ErrorCode::ConstraintViolation) return Result::Err(ErrorCode::AlreadyExists, res.message);
  return res;
}

std::optional<model::ClaimRecord> SqliteRepository::GetClaim(Transaction& t, const std::string& claim_id) {
  Statement st(TX(t).Handle(), std::string("SELECT ") + kClaimColumns + " FROM waiver_claims c WHERE c.claim_id=?;");
  st.RequireReady();
  BindText(st.get(), 1, claim_id);
  if (!st.Next()) return std::nullopt;
  return ReadClaim(st.get());
}

std::vector<model::ClaimRecord> SqliteRepository::ListClaims(Transaction& t, const ClaimFilter& filter) {
  std::string sql = std::string("SELECT ") + kClaimColumns + " FROM waiver_claims c WHERE c.league_id=?";
  if (filter.team_id) sql += " AND c.team_id=?";
  if (filter.status) sql += " AND c.status=?";
  sql += " ORDER BY c.created_at_ms DESC, c.claim_id DESC LIMIT ?;";

  Statement st(TX(t).Handle(), sql);
  st.RequireReady();
  int idx = 1;
  BindText(st.get(), idx++, filter.league_id);
  if (filter.team_id) BindText(st.get(), idx++, *filter.team_id);
  if (filter.status) BindText(st.get(), idx++, *filter.status);
  BindU64(st.get(), idx, filter.limit);

  std::vector<model::ClaimRecord> out;
  while (st.Next()) out.push_back(ReadClaim(st.get()));
  return out;
}

std::vector<model::ClaimRecord> SqliteRepository::SelectPendingClaims(Transaction& t, const std::string& league_id, ClaimOrder order, std::size_t limit) {
  const std::string direction = order == ClaimOrder::kRankAscending ? "ASC" : "DESC";
  Statement         st(TX(t).Handle(), std::string("SELECT ") + kClaimColumns +
                                   " FROM waiver_claims c LEFT JOIN waiver_priority p ON p.league_id=c.league_id AND p.team_id=c.team_id"
                                   " WHERE c.league_id=? AND c.status='pending'"
                                   " ORDER BY COALESCE(p.priority, c.priority_snapshot) " +
                                   direction + ", c.created_at_ms ASC, c.claim_id ASC LIMIT ?;");
  st.RequireReady();
  BindText(st.get(), 1, league_id);
  BindU64(st.get(), 2, limit);

  std::vector<model::ClaimRecord> out;
  while (st.Next()) out.push_back(ReadClaim(st.get()));
  return out;
}

std::optional<model::ClaimRecord> SqliteRepository::LockPendingClaim(Transaction& t, const std::string& claim_id) {
  Statement st(TX(t).Handle(), std::string("SELECT ") + kClaimColumns + " FROM waiver_claims c WHERE c.claim_id=? AND c.status='pending';");
  st.RequireReady();
  BindText(st.get(), 1, claim_id);
  if (!st.Next()) return std::nullopt;
  return ReadClaim(st.get());
}

Result SqliteRepository::ResolveClaim(Transaction& t, const std::string& claim_id, const std::string& status, const std::string& reason, uint64_t processed_at_ms) {
  auto* db  = TX(t).Handle();
  auto  res = RunWrite(
      db, "UPDATE waiver_claims SET status=?,failure_reason=?,processed_at_ms=? WHERE claim_id=? AND status='pending';",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, status);
        BindText(st, 2, reason);
        BindU64(st, 3, processed_at_ms);
        BindText(st, 4, claim_id);
      },
      &Translate);
  if (!res) return res;
  if (sqlite3_changes(db) == 1) return Result::Ok();

  auto existing = GetClaim(t, claim_id);
  if (!existing) return Result::Err(ErrorCode::NotFound);
  return Result::Err(ErrorCode::Conflict, "claim is " + existing->status);
}

std::vector<std::string> SqliteRepository::ListLeaguesWithPendingClaims(Transaction& t) {
  Statement st(TX(t).Handle(), "SELECT DISTINCT league_id FROM waiver_claims WHERE status='pending' ORDER BY league_id;");
  st.RequireReady();
  std::vector<std::string> out;
  while (st.Next()) out.push_back(ColText(st.get(), 0));
  return out;
}

uint64_t SqliteRepository::CountPendingClaims(Transaction& t, const std::string& league_id) {
  Statement st(TX(t).Handle(), "SELECT COUNT(*) FROM waiver_claims WHERE league_id=? AND status='pending';");
  st.RequireReady();
  BindText(st.get(), 1, league_id);
  return st.Next() ? ColU64(st.get(), 0) : 0;
}

std::optional<uint64_t> SqliteRepository::LastClaimProcessedAt(Transaction& t, const std::string& league_id) {
  Statement st(TX(t).Handle(), "SELECT MAX(processed_at_ms) FROM waiver_claims WHERE league_id=? AND status IN ('successful','failed');");
  st.RequireReady();
  BindText(st.get(), 1, league_id);
  if (!st.Next()) return std::nullopt;
  return ColOptU64(st.get(), 0);
}

// ------------------------------------------------------------------
// Priority
// ------------------------------------------------------------------

Result SqliteRepository::UpsertPriority(Transaction& t, const model::PriorityRecord& r) {
  return RunWrite(
      TX(t).Handle(),
      "INSERT INTO waiver_priority(league_id,team_id,priority,updated_at_ms) VALUES(?,?,?,?) "
      "ON CONFLICT(league_id,team_id) DO UPDATE SET priority=excluded.priority,updated_at_ms=excluded.updated_at_ms;",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, r.league_id);
        BindText(st, 2, r.team_id);
        BindU64(st, 3, r.rank);
        BindU64(st, 4, r.updated_at_ms);
      },
      &Translate);
}

std::optional<model::PriorityRecord> SqliteRepository::GetPriority(Transaction& t, const std::string& league_id, const std::string& team_id) {
  Statement st(TX(t).Handle(), "SELECT league_id,team_id,priority,updated_at_ms FROM waiver_priority WHERE league_id=? AND team_id=?;");
  st.RequireReady();
  BindText(st.get(), 1, league_id);
  BindText(st.get(), 2, team_id);
  if (!st.Next()) return std::nullopt;

  model::PriorityRecord r;
  r.league_id     = ColText(st.get(), 0);
  r.team_id       = ColText(st.get(), 1);
  r.rank          = ColU32(st.get(), 2);
  r.updated_at_ms = ColU64(st.get(), 3);
  return r;
}

std::vector<model::PriorityRecord> SqliteRepository::ListPriorities(Transaction& t, const std::string& league_id) {
  Statement st(TX(t).Handle(), "SELECT league_id,team_id,priority,updated_at_ms FROM waiver_priority WHERE league_id=? ORDER BY priority ASC;");
  st.RequireReady();
  BindText(st.get(), 1, league_id);

  std::vector<model::PriorityRecord> out;
  while (st.Next()) {
    model::PriorityRecord r;
    r.league_id     = ColText(st.get(), 0);
    r.team_id       = ColText(st.get(), 1);
    r.rank          = ColU32(st.get(), 2);
    r.updated_at_ms = ColU64(st.get(), 3);
    out.push_back(std::move(r));
  }
  return out;
}

/*
  UNIQUE(league_id, priority) is checked per row, so the shift runs
  through disjoint ranges: park the team at 0, flip the ranks above it
  negative, flip them back one lower, then append the team.
*/
Result SqliteRepository::RotatePriorityToBack(Transaction& t, const std::string& league_id, const std::string& team_id, uint64_t updated_at_ms) {
  auto current = GetPriority(t, league_id, team_id);
  if (!current) return Result::Err(ErrorCode::NotFound, "team has no priority rank");

  auto* db = TX(t).Handle();

  auto res = RunWrite(
      db, "UPDATE waiver_priority SET priority=0 WHERE league_id=? AND team_id=?;",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, league_id);
        BindText(st, 2, team_id);
      },
      &Translate);
  if (!res) return res;

  res = RunWrite(
      db, "UPDATE waiver_priority SET priority=-(priority-1),updated_at_ms=? WHERE league_id=? AND priority>?;",
      [&](sqlite3_stmt* st) {
        BindU64(st, 1, updated_at_ms);
        BindText(st, 2, league_id);
        BindU64(st, 3, current->rank);
      },
      &Translate);
  if (!res) return res;

  res = RunWrite(
      db, "UPDATE waiver_priority SET priority=-priority WHERE league_id=? AND priority<0;", [&](sqlite3_stmt* st) { BindText(st, 1, league_id); },
      &Translate);
  if (!res) return res;

  return RunWrite(
      db,
      "UPDATE waiver_priority SET priority=(SELECT COALESCE(MAX(priority),0)+1 FROM waiver_priority WHERE league_id=?),updated_at_ms=? "
      "WHERE league_id=? AND team_id=?;",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, league_id);
        BindU64(st, 2, updated_at_ms);
        BindText(st, 3, league_id);
        BindText(st, 4, team_id);
      },
      &Translate);
}

// ------------------------------------------------------------------
// Expiry windows
// ------------------------------------------------------------------

Result SqliteRepository::OpenExpiryWindow(Transaction& t, const model::ExpiryWindowRecord& r) {
  auto res = CloseExpiryWindows(t, r.league_id, r.player_id, r.released_at_ms);
  if (!res) return res;

  return RunWrite(
      TX(t).Handle(), "INSERT INTO player_waiver_status(league_id,player_id,released_at_ms,cleared_at_ms,released_by_team_id) VALUES(?,?,?,?,?);",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, r.league_id);
        BindText(st, 2, r.player_id);
        BindU64(st, 3, r.released_at_ms);
        BindOptU64(st, 4, r.cleared_at_ms);
        BindText(st, 5, r.released_by_team_id);
      },
      &Translate);
}

std::optional<model::ExpiryWindowRecord> SqliteRepository::GetLatestExpiryWindow(Transaction& t, const std::string& league_id, const std::string& player_id) {
  Statement st(TX(t).Handle(),
               "SELECT league_id,player_id,released_at_ms,cleared_at_ms,released_by_team_id FROM player_waiver_status "
               "WHERE league_id=? AND player_id=? ORDER BY released_at_ms DESC, id DESC LIMIT 1;");
  st.RequireReady();
  BindText(st.get(), 1, league_id);
  BindText(st.get(), 2, player_id);
  if (!st.Next()) return std::nullopt;

  model::ExpiryWindowRecord r;
  r.league_id           = ColText(st.get(), 0);
  r.player_id           = ColText(st.get(), 1);
  r.released_at_ms      = ColU64(st.get(), 2);
  r.cleared_at_ms       = ColOptU64(st.get(), 3);
  r.released_by_team_id = ColText(st.get(), 4);
  return r;
}

Result SqliteRepository::CloseExpiryWindows(Transaction& t, const std::string& league_id, const std::string& player_id, uint64_t cleared_at_ms) {
  return RunWrite(
      TX(t).Handle(), "UPDATE player_waiver_status SET cleared_at_ms=? WHERE league_id=? AND player_id=? AND cleared_at_ms IS NULL;",
      [&](sqlite3_stmt* st) {
        BindU64(st, 1, cleared_at_ms);
        BindText(st, 2, league_id);
        BindText(st, 3, player_id);
      },
      &Translate);
}

uint64_t SqliteRepository::CloseLapsedExpiryWindows(Transaction& t, const std::string& league_id, uint64_t released_before_ms, uint64_t cleared_at_ms) {
  auto* db  = TX(t).Handle();
  auto  res = RunWrite(
      db, "UPDATE player_waiver_status SET cleared_at_ms=? WHERE league_id=? AND cleared_at_ms IS NULL AND released_at_ms<=?;",
      [&](sqlite3_stmt* st) {
        BindU64(st, 1, cleared_at_ms);
        BindText(st, 2, league_id);
        BindU64(st, 3, released_before_ms);
      },
      &Translate);
  if (!res) throw std::runtime_error("closing lapsed expiry windows failed: " + res.message);
  return static_cast<uint64_t>(sqlite3_changes(db));
}

// ------------------------------------------------------------------
// Lineup cache
// ------------------------------------------------------------------

std::optional<model::LineupRecord> SqliteRepository::LockLineup(Transaction& t, const std::string& league_id, const std::string& team_id) {
  auto* db = TX(t).Handle();

  Statement head(db, "SELECT updated_at_ms FROM team_lineups WHERE league_id=? AND team_id=?;");
  head.RequireReady();
  BindText(head.get(), 1, league_id);
  BindText(head.get(), 2, team_id);
  if (!head.Next()) return std::nullopt;

  model::LineupRecord lineup;
  lineup.league_id     = league_id;
  lineup.team_id       = team_id;
  lineup.updated_at_ms = ColU64(head.get(), 0);

  Statement st(db, "SELECT player_id,slot_group FROM team_lineup_entries WHERE league_id=? AND team_id=? ORDER BY position;");
  st.RequireReady();
  BindText(st.get(), 1, league_id);
  BindText(st.get(), 2, team_id);
  while (st.Next()) {
    auto player = ColText(st.get(), 0);
    auto group  = ColText(st.get(), 1);
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

Result SqliteRepository::RemoveFromLineup(Transaction& t, const std::string& league_id, const std::string& team_id, const std::string& player_id, uint64_t updated_at_ms) {
  auto* db  = TX(t).Handle();
  auto  res = RunWrite(
      db, "DELETE FROM team_lineup_entries WHERE league_id=? AND team_id=? AND player_id=?;",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, league_id);
        BindText(st, 2, team_id);
        BindText(st, 3, player_id);
      },
      &Translate);
  if (!res) return res;

  return RunWrite(
      db, "UPDATE team_lineups SET updated_at_ms=? WHERE league_id=? AND team_id=?;",
      [&](sqlite3_stmt* st) {
        BindU64(st, 1, updated_at_ms);
        BindText(st, 2, league_id);
        BindText(st, 3, team_id);
      },
      &Translate);
}

Result SqliteRepository::AddToLineupBench(Transaction& t, const std::string& league_id, const std::string& team_id, const std::string& player_id, uint64_t updated_at_ms) {
  auto* db  = TX(t).Handle();
  auto  res = RunWrite(
      db,
      "INSERT INTO team_lineups(league_id,team_id,updated_at_ms) VALUES(?,?,?) "
      "ON CONFLICT(league_id,team_id) DO UPDATE SET updated_at_ms=excluded.updated_at_ms;",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, league_id);
        BindText(st, 2, team_id);
        BindU64(st, 3, updated_at_ms);
      },
      &Translate);
  if (!res) return res;

  return RunWrite(
      db,
      "INSERT OR IGNORE INTO team_lineup_entries(league_id,team_id,player_id,slot_group,position) "
      "SELECT ?,?,?,'bench',COALESCE(MAX(position),0)+1 FROM team_lineup_entries WHERE league_id=? AND team_id=?;",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, league_id);
        BindText(st, 2, team_id);
        BindText(st, 3, player_id);
        BindText(st, 4, league_id);
        BindText(st, 5, team_id);
      },
      &Translate);
}

// ------------------------------------------------------------------
// Draft-pick mirror
// ------------------------------------------------------------------

Result SqliteRepository::UpsertDraftPick(Transaction& t, const model::DraftPickRecord& r) {
  return RunWrite(
      TX(t).Handle(),
      "INSERT INTO draft_picks(league_id,team_id,player_id,round_number,pick_number,picked_at_ms,deleted_at_ms) VALUES(?,?,?,?,?,?,NULL) "
      "ON CONFLICT(league_id,team_id,player_id) DO UPDATE SET deleted_at_ms=NULL,picked_at_ms=excluded.picked_at_ms;",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, r.league_id);
        BindText(st, 2, r.team_id);
        BindText(st, 3, r.player_id);
        BindU64(st, 4, r.round_number);
        BindU64(st, 5, r.pick_number);
        BindU64(st, 6, r.picked_at_ms);
      },
      &Translate);
}

Result SqliteRepository::SoftDeleteDraftPick(Transaction& t, const std::string& league_id, const std::string& team_id, const std::string& player_id, uint64_t deleted_at_ms) {
  return RunWrite(
      TX(t).Handle(), "UPDATE draft_picks SET deleted_at_ms=? WHERE league_id=? AND team_id=? AND player_id=? AND deleted_at_ms IS NULL;",
      [&](sqlite3_stmt* st) {
        BindU64(st, 1, deleted_at_ms);
        BindText(st, 2, league_id);
        BindText(st, 3, team_id);
        BindText(st, 4, player_id);
      },
      &Translate);
}

std::optional<model::DraftPickRecord> SqliteRepository::GetDraftPick(Transaction& t, const std::string& league_id, const std::string& team_id, const std::string& player_id) {
  Statement st(TX(t).Handle(),
               "SELECT league_id,team_id,player_id,round_number,pick_number,picked_at_ms,deleted_at_ms FROM draft_picks "
               "WHERE league_id=? AND team_id=? AND player_id=?;");
  st.RequireReady();
  BindText(st.get(), 1, league_id);
  BindText(st.get(), 2, team_id);
  BindText(st.get(), 3, player_id);
  if (!st.Next()) return std::nullopt;

  model::DraftPickRecord r;
  r.league_id     = ColText(st.get(), 0);
  r.team_id       = ColText(st.get(), 1);
  r.player_id     = ColText(st.get(), 2);
  r.round_number  = ColU32(st.get(), 3);
  r.pick_number   = ColU32(st.get(), 4);
  r.picked_at_ms  = ColU64(st.get(), 5);
  r.deleted_at_ms = ColOptU64(st.get(), 6);
  return r;
}

uint32_t SqliteRepository::NextDraftPickNumber(Transaction& t, const std::string& league_id) {
  Statement st(TX(t).Handle(), "SELECT COALESCE(MAX(pick_number),0)+1 FROM draft_picks WHERE league_id=?;");
  st.RequireReady();
  BindText(st.get(), 1, league_id);
  return st.Next() ? ColU32(st.get(), 0) : 1;
}

} // namespace roster::db::sqlite
