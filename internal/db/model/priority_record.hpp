#pragma once

#include <cstdint>
#include <string>

namespace roster::db::model {

// Lower rank wins under the rotating policy. UNIQUE(league_id, rank).
struct PriorityRecord {
  std::string league_id;
  std::string team_id;
  uint32_t    rank          = 0;
  uint64_t    updated_at_ms = 0;
};

} // namespace roster::db::model
