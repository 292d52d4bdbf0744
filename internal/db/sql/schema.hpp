#pragma once

#include <string>
#include <vector>

namespace roster::db::sql {

/*
  Bootstrap DDL, one statement per element, idempotent
  (CREATE ... IF NOT EXISTS).

  Both dialects create the same tables:

    leagues, teams              upstream data
    roster_assignments          ownership ledger, UNIQUE(league_id, player_id)
    transaction_ledger          append-only audit
    failed_transactions         failure sink
    waiver_claims               claim lifecycle
    waiver_priority             rotation table, UNIQUE(league_id, priority)
    player_waiver_status        cooldown windows, one open row per player
    team_lineups(+_entries)     lineup cache
    draft_picks                 legacy ownership mirror
    league_locks                SQLite only, lease rows backing TryLockLeague
*/

const std::vector<std::string>& SqliteBootstrapSql();

const std::vector<std::string>& PostgresBootstrapSql();

} // namespace roster::db::sql
