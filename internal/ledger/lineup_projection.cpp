#include "lineup_projection.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace roster::ledger {

LineupProjection::LineupProjection(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void LineupProjection::Warn(const char* step, const std::string& league_id, const std::string& team_id, const std::string& player_id,
                            const std::string& error) {
  ROSTER_LOG_WARN("lineup projection write skipped",
                  {observability::StringField("step", step), observability::StringField("league_id", league_id),
                   observability::StringField("team_id", team_id), observability::StringField("player_id", player_id),
                   observability::StringField("error", error)});
}

void LineupProjection::OnRelease(db::Transaction& tx, const std::string& league_id, const std::string& team_id, const std::string& player_id,
                                 uint64_t now_ms) {
  try {
    auto res = repository_->RemoveFromLineup(tx, league_id, team_id, player_id, now_ms);
    if (!res) Warn("lineup_remove", league_id, team_id, player_id, res.message);

    res = repository_->SoftDeleteDraftPick(tx, league_id, team_id, player_id, now_ms);
    if (!res) Warn("mirror_delete", league_id, team_id, player_id, res.message);
  } catch (const std::exception& e) {
    Warn("release", league_id, team_id, player_id, e.what());
  }
}

void LineupProjection::OnAcquire(db::Transaction& tx, const std::string& league_id, const std::string& team_id, const std::string& player_id,
                                 uint64_t now_ms) {
  try {
    auto res = repository_->AddToLineupBench(tx, league_id, team_id, player_id, now_ms);
    if (!res) Warn("lineup_add", league_id, team_id, player_id, res.message);

    db::model::DraftPickRecord pick;
    pick.league_id    = league_id;
    pick.team_id      = team_id;
    pick.player_id    = player_id;
    pick.round_number = kFreeAgentRound;
    pick.pick_number  = repository_->NextDraftPickNumber(tx, league_id);
    pick.picked_at_ms = now_ms;

    res = repository_->UpsertDraftPick(tx, pick);
    if (!res) Warn("mirror_upsert", league_id, team_id, player_id, res.message);
  } catch (const std::exception& e) {
    Warn("acquire", league_id, team_id, player_id, e.what());
  }
}

} // namespace roster::ledger
