#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace roster::db::model {

/*
  Cooldown window opened when a player is released.

  At most one open (cleared_at_ms unset) window per (league, player).
*/

struct ExpiryWindowRecord {
  std::string             league_id;
  std::string             player_id;
  uint64_t                released_at_ms = 0;
  std::optional<uint64_t> cleared_at_ms;
  std::string             released_by_team_id;
};

} // namespace roster::db::model
