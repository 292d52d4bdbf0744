#include "league_settings.hpp"

#include "internal/util/time.hpp"

namespace roster::ledger {

uint64_t LeagueSettings::CooldownMs() const {
  return static_cast<uint64_t>(cooldown_hours) * util::kMillisPerHour;
}

LeagueSettings FromRecord(const db::model::LeagueRecord& record) {
  LeagueSettings settings;
  settings.league_id             = record.league_id;
  settings.max_roster_size       = record.max_roster_size;
  settings.cooldown_hours        = record.cooldown_hours;
  settings.policy                = ParsePriorityPolicy(record.priority_policy);
  settings.processing_minute_utc = record.processing_minute_utc;
  return settings;
}

db::model::LeagueRecord ToRecord(const LeagueSettings& settings, const std::string& name, uint64_t created_at_ms) {
  db::model::LeagueRecord record;
  record.league_id             = settings.league_id;
  record.name                  = name;
  record.max_roster_size       = settings.max_roster_size;
  record.cooldown_hours        = settings.cooldown_hours;
  record.priority_policy       = PolicyName(settings.policy);
  record.processing_minute_utc = settings.processing_minute_utc;
  record.created_at_ms         = created_at_ms;
  return record;
}

LeagueSettings LoadLeagueSettings(db::Repository& repo, db::Transaction& tx, const std::string& league_id, const LeagueDefaults& defaults) {
  if (auto record = repo.GetLeague(tx, league_id)) {
    return FromRecord(*record);
  }

  LeagueSettings settings;
  settings.league_id             = league_id;
  settings.max_roster_size       = defaults.max_roster_size;
  settings.cooldown_hours        = defaults.cooldown_hours;
  settings.policy                = defaults.policy;
  settings.processing_minute_utc = defaults.processing_minute_utc;
  return settings;
}

} // namespace roster::ledger
