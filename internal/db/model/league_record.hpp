#pragma once

#include <cstdint>
#include <string>

namespace roster::db::model {

/*
  Upstream league row. The ledger only reads it; the admin path seeds it.

  priority_policy is stored as text: "rotating", "reverse_standings"
  or "budget_bid".
*/

struct LeagueRecord {
  std::string league_id;
  std::string name;
  uint32_t    max_roster_size = 22;
  uint32_t    cooldown_hours  = 48;
  std::string priority_policy = "rotating";

  // Minutes after midnight UTC at which the daily claim run is due.
  uint32_t processing_minute_utc = 8 * 60;

  uint64_t created_at_ms = 0;
};

} // namespace roster::db::model
