#include "expiry_tracker.hpp"

#include "internal/observability/logging.hpp"

namespace roster::ledger {

ExpiryTracker::ExpiryTracker(std::shared_ptr<db::Repository> repository, util::ClockFn clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

bool ExpiryTracker::IsOnCooldown(db::Transaction& tx, const LeagueSettings& settings, const std::string& player_id) {
  auto window = repository_->GetLatestExpiryWindow(tx, settings.league_id, player_id);
  if (!window || window->cleared_at_ms) return false;

  const auto now = clock_();
  if (window->released_at_ms + settings.CooldownMs() > now) return true;

  auto res = repository_->CloseExpiryWindows(tx, settings.league_id, player_id, now);
  if (!res) {
    // The window has lapsed either way; the next read retries the close.
    ROSTER_LOG_WARN("failed to close lapsed expiry window", {observability::StringField("league_id", settings.league_id),
                                                             observability::StringField("player_id", player_id),
                                                             observability::StringField("error", res.message)});
  }
  return false;
}

std::optional<uint64_t> ExpiryTracker::ClearTime(db::Transaction& tx, const LeagueSettings& settings, const std::string& player_id) {
  auto window = repository_->GetLatestExpiryWindow(tx, settings.league_id, player_id);
  if (!window || window->cleared_at_ms) return std::nullopt;
  return window->released_at_ms + settings.CooldownMs();
}

db::Result ExpiryTracker::OpenWindow(db::Transaction& tx, const std::string& league_id, const std::string& player_id,
                                     const std::string& released_by_team_id, uint64_t released_at_ms) {
  db::model::ExpiryWindowRecord record;
  record.league_id           = league_id;
  record.player_id           = player_id;
  record.released_at_ms      = released_at_ms;
  record.released_by_team_id = released_by_team_id;
  return repository_->OpenExpiryWindow(tx, record);
}

db::Result ExpiryTracker::CloseWindows(db::Transaction& tx, const std::string& league_id, const std::string& player_id, uint64_t cleared_at_ms) {
  return repository_->CloseExpiryWindows(tx, league_id, player_id, cleared_at_ms);
}

uint64_t ExpiryTracker::SweepLapsed(db::Transaction& tx, const LeagueSettings& settings) {
  const auto now      = clock_();
  const auto cooldown = settings.CooldownMs();
  if (now < cooldown) return 0;
  return repository_->CloseLapsedExpiryWindows(tx, settings.league_id, now - cooldown, now);
}

} // namespace roster::ledger
