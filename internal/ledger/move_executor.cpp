#include "move_executor.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace roster::ledger {

namespace {

AppliedMove Rejected(MoveStatus status, std::string reason, FailureOperation op, std::string detail = {}) {
  AppliedMove applied;
  applied.result.status = status;
  applied.result.reason = std::move(reason);
  applied.operation     = op;
  applied.detail        = std::move(detail);
  return applied;
}

db::model::LedgerEntryRecord Entry(const MoveContext& ctx, const char* kind, const std::string& player_id) {
  db::model::LedgerEntryRecord entry;
  entry.league_id     = ctx.settings.league_id;
  entry.team_id       = ctx.team_id;
  entry.user_id       = ctx.user_id;
  entry.kind          = kind;
  entry.player_id     = player_id;
  entry.source        = ctx.source;
  entry.created_at_ms = ctx.now_ms;
  return entry;
}

FailureOperation OperationFor(const MoveRequest& request) {
  if (request.release_player_id && request.acquire_player_id) return FailureOperation::kAddDrop;
  if (request.acquire_player_id) return FailureOperation::kAdd;
  if (request.release_player_id) return FailureOperation::kDrop;
  return FailureOperation::kUnknown;
}

std::string TargetPlayer(const MoveRequest& request) {
  if (request.acquire_player_id) return *request.acquire_player_id;
  return request.release_player_id.value_or("");
}

} // namespace

MoveExecutor::MoveExecutor(std::shared_ptr<db::Repository> repository, LeagueDefaults defaults, util::ClockFn clock)
    : repository_(std::move(repository)),
      defaults_(std::move(defaults)),
      clock_(std::move(clock)),
      ledger_(repository_),
      expiry_(repository_, clock_),
      projection_(repository_),
      failures_(repository_, clock_) {
}

AppliedMove MoveExecutor::ApplyRelease(db::Transaction& tx, const MoveContext& ctx) {
  const auto& league = ctx.settings.league_id;
  const auto& player = *ctx.release_player_id;

  auto res = ledger_.Release(tx, league, ctx.team_id, player);
  if (res.code == db::ErrorCode::NotFound) {
    return Rejected(MoveStatus::kNotOwned, "team does not own player " + player, FailureOperation::kNotOwned);
  }
  if (!res) {
    return Rejected(MoveStatus::kError, "failed to release player " + player, FailureOperation::kDrop, res.message);
  }

  res = repository_->AppendLedgerEntry(tx, Entry(ctx, kEntryDrop, player));
  if (!res) {
    return Rejected(MoveStatus::kError, "failed to record release", FailureOperation::kDrop, res.message);
  }

  projection_.OnRelease(tx, league, ctx.team_id, player, ctx.now_ms);

  res = expiry_.OpenWindow(tx, league, player, ctx.team_id, ctx.now_ms);
  if (!res) {
    return Rejected(MoveStatus::kError, "failed to open waiver window", FailureOperation::kDrop, res.message);
  }
  return {};
}

AppliedMove MoveExecutor::ApplyAcquire(db::Transaction& tx, const MoveContext& ctx) {
  const auto& league         = ctx.settings.league_id;
  const auto& player         = *ctx.acquire_player_id;
  const bool  with_release   = ctx.release_player_id.has_value();
  const auto  failure_for_op = with_release ? FailureOperation::kAddDrop : FailureOperation::kAdd;

  if (!with_release) {
    const auto size = ledger_.RosterSize(tx, league, ctx.team_id);
    if (size >= ctx.settings.max_roster_size) {
      return Rejected(MoveStatus::kRosterFull,
                      "roster is full (" + std::to_string(size) + "/" + std::to_string(ctx.settings.max_roster_size) + ")",
                      FailureOperation::kRosterFull);
    }
  }

  if (ctx.enforce_cooldown && expiry_.IsOnCooldown(tx, ctx.settings, player)) {
    const auto clears_at = expiry_.ClearTime(tx, ctx.settings, player).value_or(ctx.now_ms);
    return Rejected(MoveStatus::kError, "player is on waivers until " + util::FormatUtc(clears_at), FailureOperation::kOnWaivers);
  }

  auto res = ledger_.Acquire(tx, league, ctx.team_id, player, ctx.now_ms);
  if (res.code == db::ErrorCode::ConstraintViolation) {
    return Rejected(MoveStatus::kDuplicatePlayer, "player " + player + " is already rostered in this league", FailureOperation::kAddDuplicate,
                    res.message);
  }
  if (!res) {
    return Rejected(MoveStatus::kError, "failed to acquire player " + player, failure_for_op, res.message);
  }

  res = repository_->AppendLedgerEntry(tx, Entry(ctx, kEntryAdd, player));
  if (!res) {
    return Rejected(MoveStatus::kError, "failed to record acquisition", failure_for_op, res.message);
  }

  projection_.OnAcquire(tx, league, ctx.team_id, player, ctx.now_ms);

  res = expiry_.CloseWindows(tx, league, player, ctx.now_ms);
  if (!res) {
    return Rejected(MoveStatus::kError, "failed to close waiver window", failure_for_op, res.message);
  }
  return {};
}

AppliedMove MoveExecutor::Apply(db::Transaction& tx, const MoveContext& ctx) {
  if (ctx.release_player_id) {
    auto released = ApplyRelease(tx, ctx);
    if (!released.result.ok()) {
      released.result.team_id = ctx.team_id;
      return released;
    }
  }

  if (ctx.acquire_player_id) {
    auto acquired = ApplyAcquire(tx, ctx);
    if (!acquired.result.ok()) {
      acquired.result.team_id = ctx.team_id;
      return acquired;
    }
  }

  AppliedMove applied;
  applied.result.team_id = ctx.team_id;
  return applied;
}

MoveResult MoveExecutor::Execute(const MoveRequest& request) {
  observability::SpanScope span("MoveExecutor.Execute");
  span.SetAttribute("league_id", request.league_id);

  MoveResult result;
  if (request.league_id.empty() || request.user_id.empty()) {
    result.status = MoveStatus::kError;
    result.reason = "league_id and user_id are required";
    return result;
  }
  if (!request.release_player_id && !request.acquire_player_id) {
    result.status = MoveStatus::kError;
    result.reason = "a move needs a player to release or acquire";
    return result;
  }

  std::string team_id;
  AppliedMove applied;
  try {
    auto tx   = repository_->Begin();
    auto team = repository_->FindTeamByOwner(*tx, request.league_id, request.user_id);
    if (!team) {
      tx->Rollback();
      result.status = MoveStatus::kNoTeam;
      result.reason = "user has no team in league " + request.league_id;
      observability::Metrics::Instance().RecordMoveOutcome(ToString(result.status));
      return result;
    }
    team_id = team->team_id;

    MoveContext ctx;
    ctx.settings          = LoadLeagueSettings(*repository_, *tx, request.league_id, defaults_);
    ctx.team_id           = team_id;
    ctx.user_id           = request.user_id;
    ctx.release_player_id = request.release_player_id;
    ctx.acquire_player_id = request.acquire_player_id;
    ctx.source            = request.source;
    ctx.now_ms            = clock_();

    applied = Apply(*tx, ctx);
    if (applied.result.ok()) {
      tx->Commit();
    } else {
      tx->Rollback();
    }
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    applied                = Rejected(MoveStatus::kError, "unexpected error while applying move", OperationFor(request), e.what());
    applied.result.team_id = team_id;
  }

  observability::Metrics::Instance().RecordMoveOutcome(ToString(applied.result.status));

  if (applied.result.ok()) {
    ROSTER_LOG_INFO("move applied", {observability::StringField("league_id", request.league_id), observability::StringField("team_id", team_id),
                                     observability::StringField("release", request.release_player_id.value_or("")),
                                     observability::StringField("acquire", request.acquire_player_id.value_or("")),
                                     observability::StringField("source", request.source)});
    return applied.result;
  }

  ROSTER_LOG_WARN("move rejected", {observability::StringField("league_id", request.league_id), observability::StringField("team_id", team_id),
                                    observability::StringField("status", ToString(applied.result.status)),
                                    observability::StringField("reason", applied.result.reason),
                                    observability::StringField("detail", applied.detail)});

  FailedAttempt attempt;
  attempt.league_id     = request.league_id;
  attempt.team_id       = team_id;
  attempt.user_id       = request.user_id;
  attempt.operation     = applied.operation;
  attempt.player_id     = TargetPlayer(request);
  attempt.error_message = applied.result.reason;
  attempt.error_detail  = applied.detail;
  failures_.Record(attempt);

  return applied.result;
}

MoveBatchSummary MoveExecutor::ExecuteBatch(const std::vector<MoveRequest>& requests) {
  MoveBatchSummary summary;
  summary.results.reserve(requests.size());
  for (const auto& request : requests) {
    auto result = Execute(request);
    if (result.ok()) {
      ++summary.succeeded;
    } else {
      ++summary.failed;
    }
    summary.results.push_back(std::move(result));
  }
  return summary;
}

} // namespace roster::ledger
