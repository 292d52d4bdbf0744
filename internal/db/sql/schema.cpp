#include "internal/db/sql/schema.hpp"

namespace roster::db::sql {

const std::vector<std::string>& SqliteBootstrapSql() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS leagues (league_id TEXT PRIMARY KEY, name TEXT NOT NULL DEFAULT '', max_roster_size INTEGER NOT NULL DEFAULT 22, cooldown_hours INTEGER NOT NULL DEFAULT 48, priority_policy TEXT NOT NULL DEFAULT 'rotating' CHECK(priority_policy IN ('rotating','reverse_standings','budget_bid')), processing_minute_utc INTEGER NOT NULL DEFAULT 480, created_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS teams (team_id TEXT PRIMARY KEY, league_id TEXT NOT NULL REFERENCES leagues(league_id) ON DELETE CASCADE, owner_user_id TEXT, name TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS idx_teams_owner ON teams(league_id, owner_user_id);",
      "CREATE TABLE IF NOT EXISTS roster_assignments (league_id TEXT NOT NULL, team_id TEXT NOT NULL REFERENCES teams(team_id) ON DELETE CASCADE, player_id TEXT NOT NULL, acquired_at_ms INTEGER NOT NULL, UNIQUE(league_id, player_id));",
      "CREATE INDEX IF NOT EXISTS idx_roster_assignments_team ON roster_assignments(league_id, team_id);",
      "CREATE TABLE IF NOT EXISTS transaction_ledger (entry_id INTEGER PRIMARY KEY AUTOINCREMENT, league_id TEXT NOT NULL, team_id TEXT NOT NULL, user_id TEXT NOT NULL, kind TEXT NOT NULL CHECK(kind IN ('ADD','DROP','TRADE','DRAFT')), player_id TEXT NOT NULL, source TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_transaction_ledger_league ON transaction_ledger(league_id, created_at_ms);",
      "CREATE TABLE IF NOT EXISTS failed_transactions (id TEXT PRIMARY KEY, league_id TEXT NOT NULL, team_id TEXT NOT NULL DEFAULT '', user_id TEXT NOT NULL DEFAULT '', operation TEXT NOT NULL, player_id TEXT NOT NULL DEFAULT '', error_message TEXT NOT NULL, error_detail TEXT NOT NULL DEFAULT '', attempted_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_failed_transactions_league ON failed_transactions(league_id, attempted_at_ms);",
      "CREATE TABLE IF NOT EXISTS waiver_claims (claim_id TEXT PRIMARY KEY, league_id TEXT NOT NULL, team_id TEXT NOT NULL REFERENCES teams(team_id) ON DELETE CASCADE, player_id TEXT NOT NULL, release_player_id TEXT, priority_snapshot INTEGER NOT NULL DEFAULT 0, status TEXT NOT NULL DEFAULT 'pending' CHECK(status IN ('pending','successful','failed','cancelled')), created_at_ms INTEGER NOT NULL, processed_at_ms INTEGER, failure_reason TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS idx_waiver_claims_pending ON waiver_claims(league_id, status, created_at_ms);",
      "CREATE UNIQUE INDEX IF NOT EXISTS idx_waiver_claims_one_pending ON waiver_claims(team_id, player_id) WHERE status='pending';",
      "CREATE TABLE IF NOT EXISTS waiver_priority (league_id TEXT NOT NULL, team_id TEXT NOT NULL REFERENCES teams(team_id) ON DELETE CASCADE, priority INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL DEFAULT 0, PRIMARY KEY(league_id, team_id), UNIQUE(league_id, priority));",
      "CREATE TABLE IF NOT EXISTS player_waiver_status (id INTEGER PRIMARY KEY AUTOINCREMENT, league_id TEXT NOT NULL, player_id TEXT NOT NULL, released_at_ms INTEGER NOT NULL, cleared_at_ms INTEGER, released_by_team_id TEXT NOT NULL DEFAULT '');",
      "CREATE UNIQUE INDEX IF NOT EXISTS idx_player_waiver_status_open ON player_waiver_status(league_id, player_id) WHERE cleared_at_ms IS NULL;",
      "CREATE INDEX IF NOT EXISTS idx_player_waiver_status_latest ON player_waiver_status(league_id, player_id, released_at_ms);",
      "CREATE TABLE IF NOT EXISTS team_lineups (league_id TEXT NOT NULL, team_id TEXT NOT NULL, updated_at_ms INTEGER NOT NULL, PRIMARY KEY(league_id, team_id));",
      "CREATE TABLE IF NOT EXISTS team_lineup_entries (league_id TEXT NOT NULL, team_id TEXT NOT NULL, player_id TEXT NOT NULL, slot_group TEXT NOT NULL CHECK(slot_group IN ('active','bench','ir')), position INTEGER NOT NULL, PRIMARY KEY(league_id, team_id, player_id), FOREIGN KEY(league_id, team_id) REFERENCES team_lineups(league_id, team_id) ON DELETE CASCADE);",
      "CREATE TABLE IF NOT EXISTS draft_picks (league_id TEXT NOT NULL, team_id TEXT NOT NULL, player_id TEXT NOT NULL, round_number INTEGER NOT NULL, pick_number INTEGER NOT NULL, picked_at_ms INTEGER NOT NULL, deleted_at_ms INTEGER, PRIMARY KEY(league_id, team_id, player_id));",
      "CREATE TABLE IF NOT EXISTS league_locks (league_id TEXT PRIMARY KEY, holder TEXT NOT NULL, acquired_at_ms INTEGER NOT NULL);"};
  return kBootstrapSql;
}

const std::vector<std::string>& PostgresBootstrapSql() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS leagues (league_id TEXT PRIMARY KEY, name TEXT NOT NULL DEFAULT '', max_roster_size INTEGER NOT NULL DEFAULT 22, cooldown_hours INTEGER NOT NULL DEFAULT 48, priority_policy TEXT NOT NULL DEFAULT 'rotating' CHECK(priority_policy IN ('rotating','reverse_standings','budget_bid')), processing_minute_utc INTEGER NOT NULL DEFAULT 480, created_at_ms BIGINT NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS teams (team_id TEXT PRIMARY KEY, league_id TEXT NOT NULL REFERENCES leagues(league_id) ON DELETE CASCADE, owner_user_id TEXT, name TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS idx_teams_owner ON teams(league_id, owner_user_id);",
      "CREATE TABLE IF NOT EXISTS roster_assignments (league_id TEXT NOT NULL, team_id TEXT NOT NULL REFERENCES teams(team_id) ON DELETE CASCADE, player_id TEXT NOT NULL, acquired_at_ms BIGINT NOT NULL, CONSTRAINT roster_assignments_league_player_key UNIQUE(league_id, player_id));",
      "CREATE INDEX IF NOT EXISTS idx_roster_assignments_team ON roster_assignments(league_id, team_id);",
      "CREATE TABLE IF NOT EXISTS transaction_ledger (entry_id BIGSERIAL PRIMARY KEY, league_id TEXT NOT NULL, team_id TEXT NOT NULL, user_id TEXT NOT NULL, kind TEXT NOT NULL CHECK(kind IN ('ADD','DROP','TRADE','DRAFT')), player_id TEXT NOT NULL, source TEXT NOT NULL, created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_transaction_ledger_league ON transaction_ledger(league_id, created_at_ms);",
      "CREATE TABLE IF NOT EXISTS failed_transactions (id TEXT PRIMARY KEY, league_id TEXT NOT NULL, team_id TEXT NOT NULL DEFAULT '', user_id TEXT NOT NULL DEFAULT '', operation TEXT NOT NULL, player_id TEXT NOT NULL DEFAULT '', error_message TEXT NOT NULL, error_detail TEXT NOT NULL DEFAULT '', attempted_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_failed_transactions_league ON failed_transactions(league_id, attempted_at_ms);",
      "CREATE TABLE IF NOT EXISTS waiver_claims (claim_id TEXT PRIMARY KEY, league_id TEXT NOT NULL, team_id TEXT NOT NULL REFERENCES teams(team_id) ON DELETE CASCADE, player_id TEXT NOT NULL, release_player_id TEXT, priority_snapshot INTEGER NOT NULL DEFAULT 0, status TEXT NOT NULL DEFAULT 'pending' CHECK(status IN ('pending','successful','failed','cancelled')), created_at_ms BIGINT NOT NULL, processed_at_ms BIGINT, failure_reason TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS idx_waiver_claims_pending ON waiver_claims(league_id, status, created_at_ms);",
      "CREATE UNIQUE INDEX IF NOT EXISTS idx_waiver_claims_one_pending ON waiver_claims(team_id, player_id) WHERE status='pending';",
      "CREATE TABLE IF NOT EXISTS waiver_priority (league_id TEXT NOT NULL, team_id TEXT NOT NULL REFERENCES teams(team_id) ON DELETE CASCADE, priority INTEGER NOT NULL, updated_at_ms BIGINT NOT NULL DEFAULT 0, PRIMARY KEY(league_id, team_id), UNIQUE(league_id, priority));",
      "CREATE TABLE IF NOT EXISTS player_waiver_status (id BIGSERIAL PRIMARY KEY, league_id TEXT NOT NULL, player_id TEXT NOT NULL, released_at_ms BIGINT NOT NULL, cleared_at_ms BIGINT, released_by_team_id TEXT NOT NULL DEFAULT '');",
      "CREATE UNIQUE INDEX IF NOT EXISTS idx_player_waiver_status_open ON player_waiver_status(league_id, player_id) WHERE cleared_at_ms IS NULL;",
      "CREATE INDEX IF NOT EXISTS idx_player_waiver_status_latest ON player_waiver_status(league_id, player_id, released_at_ms DESC);",
      "CREATE TABLE IF NOT EXISTS team_lineups (league_id TEXT NOT NULL, team_id TEXT NOT NULL, updated_at_ms BIGINT NOT NULL, PRIMARY KEY(league_id, team_id));",
      "CREATE TABLE IF NOT EXISTS team_lineup_entries (league_id TEXT NOT NULL, team_id TEXT NOT NULL, player_id TEXT NOT NULL, slot_group TEXT NOT NULL CHECK(slot_group IN ('active','bench','ir')), position INTEGER NOT NULL, PRIMARY KEY(league_id, team_id, player_id), FOREIGN KEY(league_id, team_id) REFERENCES team_lineups(league_id, team_id) ON DELETE CASCADE);",
      "CREATE TABLE IF NOT EXISTS draft_picks (league_id TEXT NOT NULL, team_id TEXT NOT NULL, player_id TEXT NOT NULL, round_number INTEGER NOT NULL, pick_number INTEGER NOT NULL, picked_at_ms BIGINT NOT NULL, deleted_at_ms BIGINT, PRIMARY KEY(league_id, team_id, player_id));"};
  return kBootstrapSql;
}

} // namespace roster::db::sql
