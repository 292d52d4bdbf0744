#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace roster::db::model {

/*
  Lineup display cache. Derived from the ownership ledger and never
  authoritative. Grouping names match the team_lineup_entries column:
  "active", "bench", "ir".
*/

struct LineupRecord {
  std::string              league_id;
  std::string              team_id;
  std::vector<std::string> active;
  std::vector<std::string> bench;
  std::vector<std::string> injured_reserve;
  uint64_t                 updated_at_ms = 0;
};

} // namespace roster::db::model
