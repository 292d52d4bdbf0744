#include "claim_book.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace roster::ledger {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::ConstraintViolation:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

uint32_t SnapshotRank(db::Repository& repo, db::Transaction& tx, const std::string& league_id, const std::string& team_id) {
  if (auto rank = repo.GetPriority(tx, league_id, team_id)) {
    return rank->rank;
  }
  // Unranked teams queue behind every ranked team.
  uint32_t worst = 0;
  for (const auto& entry : repo.ListPriorities(tx, league_id)) worst = std::max(worst, entry.rank);
  return worst + 1;
}

} // namespace

ClaimBook::ClaimBook(std::shared_ptr<db::Repository> repository, std::shared_ptr<MoveExecutor> executor, LeagueDefaults defaults,
                     util::ClockFn clock)
    : repository_(std::move(repository)),
      executor_(std::move(executor)),
      defaults_(std::move(defaults)),
      clock_(std::move(clock)),
      ledger_(repository_),
      expiry_(repository_, clock_) {
}

db::model::ClaimRecord ClaimBook::SubmitClaim(const ClaimRequest& request) {
  if (request.league_id.empty() || request.user_id.empty() || request.player_id.empty()) {
    throw util::InvalidArgument("league_id, user_id and player_id are required");
  }
  if (request.release_player_id && *request.release_player_id == request.player_id) {
    throw util::InvalidArgument("cannot claim and release the same player");
  }

  auto tx   = repository_->Begin();
  auto team = repository_->FindTeamByOwner(*tx, request.league_id, request.user_id);
  if (!team) {
    throw util::NotFound("user has no team in league " + request.league_id);
  }

  if (ledger_.OwnerOf(*tx, request.league_id, request.player_id)) {
    throw util::InvalidState("player " + request.player_id + " is already rostered");
  }
  if (request.release_player_id) {
    auto owner = ledger_.OwnerOf(*tx, request.league_id, *request.release_player_id);
    if (!owner || *owner != team->team_id) {
      throw util::InvalidArgument("team does not own player " + *request.release_player_id);
    }
  }

  db::model::ClaimRecord claim;
  claim.claim_id          = util::NewId();
  claim.league_id         = request.league_id;
  claim.team_id           = team->team_id;
  claim.player_id         = request.player_id;
  claim.release_player_id = request.release_player_id;
  claim.priority_snapshot = SnapshotRank(*repository_, *tx, request.league_id, team->team_id);
  claim.status            = ToString(ClaimStatus::kPending);
  claim.created_at_ms     = clock_();

  // One pending claim per (team, player) is a store constraint.
  const auto inserted = repository_->InsertClaim(*tx, claim);
  if (inserted.code == db::ErrorCode::AlreadyExists) {
    throw util::AlreadyExists("team already has a pending claim for player " + request.player_id);
  }
  ThrowIfDbError(inserted, "insert claim");
  tx->Commit();

  ROSTER_LOG_INFO("claim submitted", {observability::StringField("claim_id", claim.claim_id), observability::StringField("league_id", claim.league_id),
                                      observability::StringField("team_id", claim.team_id), observability::StringField("player_id", claim.player_id),
                                      observability::IntField("priority", claim.priority_snapshot)});
  return claim;
}

db::model::ClaimRecord ClaimBook::CancelClaim(const std::string& claim_id, const std::string& user_id) {
  if (claim_id.empty() || user_id.empty()) {
    throw util::InvalidArgument("claim_id and user_id are required");
  }

  auto tx    = repository_->Begin();
  auto claim = repository_->GetClaim(*tx, claim_id);
  if (!claim) {
    throw util::NotFound("claim not found: " + claim_id);
  }

  auto team = repository_->GetTeam(*tx, claim->team_id);
  if (!team || !team->owner_user_id || *team->owner_user_id != user_id) {
    throw util::PermissionDenied("only the requesting team's owner can cancel a claim");
  }
  if (claim->status != ToString(ClaimStatus::kPending)) {
    throw util::InvalidState("claim is already " + claim->status);
  }

  const auto now = clock_();
  ThrowIfDbError(repository_->ResolveClaim(*tx, claim_id, ToString(ClaimStatus::kCancelled), "Cancelled by requester", now), "cancel claim");
  tx->Commit();

  claim->status          = ToString(ClaimStatus::kCancelled);
  claim->failure_reason  = "Cancelled by requester";
  claim->processed_at_ms = now;

  ROSTER_LOG_INFO("claim cancelled", {observability::StringField("claim_id", claim_id), observability::StringField("league_id", claim->league_id)});
  return *claim;
}

std::vector<db::model::ClaimRecord> ClaimBook::ListClaims(db::ClaimFilter filter) {
  if (filter.league_id.empty()) {
    throw util::InvalidArgument("league_id is required");
  }
  if (filter.status && !ParseClaimStatus(*filter.status)) {
    throw util::InvalidArgument("unknown claim status: " + *filter.status);
  }
  if (filter.limit == 0) filter.limit = 100;
  filter.limit = std::min(filter.limit, kMaxListLimit);

  auto tx     = repository_->Begin();
  auto claims = repository_->ListClaims(*tx, filter);
  tx->Commit();
  return claims;
}

Availability ClaimBook::CheckAvailability(const std::string& league_id, const std::string& player_id) {
  if (league_id.empty() || player_id.empty()) {
    throw util::InvalidArgument("league_id and player_id are required");
  }

  Availability out;
  out.player_id = player_id;

  auto tx = repository_->Begin();
  if (auto owner = ledger_.OwnerOf(*tx, league_id, player_id)) {
    tx->Commit();
    out.owner_team_id = *owner;
    out.reason        = "rostered by team " + *owner;
    return out;
  }

  const auto settings = LoadLeagueSettings(*repository_, *tx, league_id, defaults_);
  out.on_waivers      = expiry_.IsOnCooldown(*tx, settings, player_id);
  if (out.on_waivers) {
    out.waivers_clear_at_ms = expiry_.ClearTime(*tx, settings, player_id);
  }
  // IsOnCooldown may have closed a lapsed window.
  tx->Commit();

  out.available = !out.on_waivers;
  if (out.on_waivers && out.waivers_clear_at_ms) {
    out.reason = "on waivers until " + util::FormatUtc(*out.waivers_clear_at_ms);
  }
  return out;
}

AddPlayerResult ClaimBook::AddPlayer(const ClaimRequest& request) {
  const auto availability = CheckAvailability(request.league_id, request.player_id);

  AddPlayerResult result;
  if (availability.on_waivers) {
    result.claim = SubmitClaim(request);
    return result;
  }

  MoveRequest move;
  move.league_id         = request.league_id;
  move.user_id           = request.user_id;
  move.acquire_player_id = request.player_id;
  move.release_player_id = request.release_player_id;
  move.source            = "free_agency";
  result.move            = executor_->Execute(move);
  return result;
}

} // namespace roster::ledger
