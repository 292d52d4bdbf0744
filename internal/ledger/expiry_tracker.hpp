#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/ledger/league_settings.hpp"
#include "internal/util/time.hpp"

namespace roster::ledger {

/*
  Cooldown ("on waivers") tracking for released players.

  A release opens a window; it lapses cooldown_hours later. Lapsed windows
  are closed lazily by IsOnCooldown, or in bulk by SweepLapsed.
*/
class ExpiryTracker {
 public:
  ExpiryTracker(std::shared_ptr<db::Repository> repository, util::ClockFn clock);

  // Closes the latest window as a side effect when it has lapsed.
  bool IsOnCooldown(db::Transaction& tx, const LeagueSettings& settings, const std::string& player_id);

  // When the open window lapses; nullopt without an open window.
  std::optional<uint64_t> ClearTime(db::Transaction& tx, const LeagueSettings& settings, const std::string& player_id);

  db::Result OpenWindow(db::Transaction& tx, const std::string& league_id, const std::string& player_id, const std::string& released_by_team_id,
                        uint64_t released_at_ms);

  db::Result CloseWindows(db::Transaction& tx, const std::string& league_id, const std::string& player_id, uint64_t cleared_at_ms);

  // Closes every lapsed window in the league. Returns how many were closed.
  uint64_t SweepLapsed(db::Transaction& tx, const LeagueSettings& settings);

 private:
  std::shared_ptr<db::Repository> repository_;
  util::ClockFn                   clock_;
};

} // namespace roster::ledger
