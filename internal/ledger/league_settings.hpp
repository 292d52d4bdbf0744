#pragma once

#include <cstdint>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/ledger/priority_policy.hpp"

namespace roster::ledger {

// Applied to leagues the store has no row for.
struct LeagueDefaults {
  uint32_t       max_roster_size       = 22;
  uint32_t       cooldown_hours        = 48;
  PriorityPolicy policy                = RotatingPolicy{};
  uint32_t       processing_minute_utc = 8 * 60;
};

struct LeagueSettings {
  std::string    league_id;
  uint32_t       max_roster_size       = 22;
  uint32_t       cooldown_hours        = 48;
  PriorityPolicy policy                = RotatingPolicy{};
  uint32_t       processing_minute_utc = 8 * 60;

  uint64_t CooldownMs() const;
};

LeagueSettings LoadLeagueSettings(db::Repository& repo, db::Transaction& tx, const std::string& league_id, const LeagueDefaults& defaults);

LeagueSettings FromRecord(const db::model::LeagueRecord& record);
db::model::LeagueRecord ToRecord(const LeagueSettings& settings, const std::string& name, uint64_t created_at_ms);

} // namespace roster::ledger
