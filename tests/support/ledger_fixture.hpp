#pragma once

#include <atomic>
#include <cassert>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace roster::testing {

// Settable clock shared by every component built from it.
class ManualClock {
 public:
  explicit ManualClock(uint64_t start_ms) : now_(std::make_shared<std::atomic<uint64_t>>(start_ms)) {
  }

  util::ClockFn Fn() const {
    auto now = now_;
    return [now] { return now->load(); };
  }

  uint64_t Now() const {
    return now_->load();
  }

  void Set(uint64_t ms) {
    now_->store(ms);
  }

  void Advance(uint64_t ms) {
    now_->fetch_add(ms);
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_;
};

// 2026-01-17T06:00:00Z
inline constexpr uint64_t kSaturdayMorningMs = 1768629600000ULL;

inline void SeedLeague(db::Repository& repo, const std::string& league_id, uint32_t max_roster_size = 22, uint32_t cooldown_hours = 48,
                       const std::string& policy = "rotating", uint32_t processing_minute_utc = 8 * 60) {
  auto tx = repo.Begin();

  db::model::LeagueRecord league;
  league.league_id             = league_id;
  league.name                  = league_id;
  league.max_roster_size       = max_roster_size;
  league.cooldown_hours        = cooldown_hours;
  league.priority_policy       = policy;
  league.processing_minute_utc = processing_minute_utc;
  league.created_at_ms         = 1;
  assert(repo.UpsertLeague(*tx, league));
  tx->Commit();
}

// rank 0 leaves the team unranked.
inline void SeedTeam(db::Repository& repo, const std::string& league_id, const std::string& team_id, std::optional<std::string> owner,
                     uint32_t rank = 0) {
  auto tx = repo.Begin();

  db::model::TeamRecord team;
  team.team_id       = team_id;
  team.league_id     = league_id;
  team.owner_user_id = std::move(owner);
  team.name          = team_id;
  team.created_at_ms = 1;
  assert(repo.UpsertTeam(*tx, team));

  if (rank > 0) {
    db::model::PriorityRecord priority;
    priority.league_id = league_id;
    priority.team_id   = team_id;
    priority.rank      = rank;
    assert(repo.UpsertPriority(*tx, priority));
  }
  tx->Commit();
}

inline void SeedRoster(db::Repository& repo, const std::string& league_id, const std::string& team_id, std::initializer_list<std::string> players) {
  auto     tx = repo.Begin();
  uint64_t at = 1;
  for (const auto& player : players) {
    db::model::RosterAssignmentRecord assignment;
    assignment.league_id      = league_id;
    assignment.team_id        = team_id;
    assignment.player_id      = player;
    assignment.acquired_at_ms = at++;
    assert(repo.InsertAssignment(*tx, assignment));
  }
  tx->Commit();
}

inline std::optional<std::string> OwnerOf(db::Repository& repo, const std::string& league_id, const std::string& player_id) {
  auto tx         = repo.Begin();
  auto assignment = repo.GetAssignment(*tx, league_id, player_id);
  tx->Commit();
  if (!assignment) return std::nullopt;
  return assignment->team_id;
}

} // namespace roster::testing
