#pragma once

#include <cstdint>
#include <string>

namespace roster::db::model {

/*
  Authoritative ownership row.

  IMPORTANT:
  - UNIQUE(league_id, player_id) is enforced by the store.
  - Rows are inserted and deleted, never updated in place.
*/

struct RosterAssignmentRecord {
  std::string league_id;
  std::string team_id;
  std::string player_id;
  uint64_t    acquired_at_ms = 0;
};

} // namespace roster::db::model
