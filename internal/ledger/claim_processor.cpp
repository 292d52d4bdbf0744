#include "claim_processor.hpp"

#include <chrono>
#include <exception>
#include <set>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace roster::ledger {

namespace {

constexpr const char* kClaimSource = "waivers";

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (!result) {
    throw std::runtime_error(context + ": " + db::ToString(result.code) + (result.message.empty() ? "" : " " + result.message));
  }
}

ClaimOutcome OutcomeOf(const db::model::ClaimRecord& claim, ClaimStatus status, std::string reason) {
  ClaimOutcome outcome;
  outcome.claim_id  = claim.claim_id;
  outcome.team_id   = claim.team_id;
  outcome.player_id = claim.player_id;
  outcome.status    = status;
  outcome.reason    = std::move(reason);
  return outcome;
}

} // namespace

ClaimProcessor::ClaimProcessor(std::shared_ptr<db::Repository> repository, std::shared_ptr<MoveExecutor> executor, LeagueDefaults defaults,
                               ClaimProcessorOptions options, util::ClockFn clock)
    : repository_(std::move(repository)),
      executor_(std::move(executor)),
      defaults_(std::move(defaults)),
      options_(options),
      clock_(std::move(clock)),
      ledger_(repository_),
      expiry_(repository_, clock_) {
  if (options_.batch_size == 0) options_.batch_size = 100;
}

void ClaimProcessor::RecordFailure(const db::model::ClaimRecord& claim, const std::string& user_id, FailureOperation op, const std::string& reason,
                                   const std::string& detail) {
  FailedAttempt attempt;
  attempt.league_id     = claim.league_id;
  attempt.team_id       = claim.team_id;
  attempt.user_id       = user_id;
  attempt.operation     = op;
  attempt.player_id     = claim.player_id;
  attempt.error_message = reason;
  attempt.error_detail  = detail.empty() ? "claim " + claim.claim_id : detail;
  executor_->Failures().Record(attempt);
}

// Fails the claim inside the transaction that locked it and commits.
ClaimOutcome ClaimProcessor::RejectLocked(db::Transaction& tx, const db::model::ClaimRecord& claim, const std::string& reason) {
  ThrowIfDbError(repository_->ResolveClaim(tx, claim.claim_id, ToString(ClaimStatus::kFailed), reason, clock_()), "resolve claim");
  tx.Commit();
  return OutcomeOf(claim, ClaimStatus::kFailed, reason);
}

// The move's transaction is gone; the claim is failed in a fresh one.
// nullopt when the claim stopped being pending in between.
std::optional<ClaimOutcome> ClaimProcessor::RejectAfterRollback(const db::model::ClaimRecord& claim, const AppliedMove& applied) {
  auto tx  = repository_->Begin();
  auto res = repository_->ResolveClaim(*tx, claim.claim_id, ToString(ClaimStatus::kFailed), applied.result.reason, clock_());
  if (res.code == db::ErrorCode::Conflict) {
    tx->Rollback();
    return std::nullopt;
  }
  ThrowIfDbError(res, "resolve claim");
  tx->Commit();
  return OutcomeOf(claim, ClaimStatus::kFailed, applied.result.reason);
}

ClaimProcessor::Step ClaimProcessor::ProcessOne(const LeagueSettings& settings, const std::string& claim_id, std::vector<ClaimOutcome>& outcomes) {
  auto tx    = repository_->Begin();
  auto claim = repository_->LockPendingClaim(*tx, claim_id);
  if (!claim) {
    tx->Rollback();
    return Step::kSkipped;
  }

  auto team = repository_->GetTeam(*tx, claim->team_id);
  if (!team || !team->owner_user_id) {
    outcomes.push_back(RejectLocked(*tx, *claim, kReasonNoOwner));
    RecordFailure(*claim, "", FailureOperation::kUnknown, kReasonNoOwner, "");
    return Step::kResolved;
  }
  const auto user_id = *team->owner_user_id;

  repository_->LockLineup(*tx, settings.league_id, claim->team_id);

  if (repository_->ProbeOwnership(*tx, settings.league_id, claim->player_id) != db::OwnershipProbe::kFree) {
    outcomes.push_back(RejectLocked(*tx, *claim, kReasonAlreadyRostered));
    RecordFailure(*claim, user_id, FailureOperation::kAddDuplicate, kReasonAlreadyRostered, "");
    return Step::kResolved;
  }

  if (expiry_.IsOnCooldown(*tx, settings, claim->player_id)) {
    ROSTER_LOG_DEBUG("claim proceeds for player on waivers",
                     {observability::StringField("claim_id", claim->claim_id), observability::StringField("player_id", claim->player_id)});
  }

  if (!claim->release_player_id && ledger_.RosterSize(*tx, settings.league_id, claim->team_id) >= settings.max_roster_size) {
    outcomes.push_back(RejectLocked(*tx, *claim, kReasonRosterFull));
    RecordFailure(*claim, user_id, FailureOperation::kRosterFull, kReasonRosterFull, "");
    return Step::kResolved;
  }

  MoveContext ctx;
  ctx.settings          = settings;
  ctx.team_id           = claim->team_id;
  ctx.user_id           = user_id;
  ctx.release_player_id = claim->release_player_id;
  ctx.acquire_player_id = claim->player_id;
  ctx.source            = kClaimSource;
  ctx.now_ms            = clock_();
  ctx.enforce_cooldown  = false;

  AppliedMove applied;
  try {
    applied = executor_->Apply(*tx, ctx);
  } catch (const std::exception& e) {
    applied.result.status = MoveStatus::kError;
    applied.result.reason = "unexpected error while applying claim";
    applied.operation     = claim->release_player_id ? FailureOperation::kAddDrop : FailureOperation::kAdd;
    applied.detail        = e.what();
  }

  if (!applied.result.ok()) {
    tx->Rollback();
    tx.reset();

    ROSTER_LOG_WARN("claim move rejected", {observability::StringField("claim_id", claim->claim_id),
                                            observability::StringField("status", ToString(applied.result.status)),
                                            observability::StringField("reason", applied.result.reason),
                                            observability::StringField("detail", applied.detail)});

    auto outcome = RejectAfterRollback(*claim, applied);
    if (!outcome) return Step::kSkipped;
    outcomes.push_back(std::move(*outcome));
    RecordFailure(*claim, user_id, applied.operation, applied.result.reason, applied.detail);
    return Step::kResolved;
  }

  ThrowIfDbError(repository_->ResolveClaim(*tx, claim->claim_id, ToString(ClaimStatus::kSuccessful), "", ctx.now_ms), "resolve claim");

  if (RotatesOnSuccess(settings.policy)) {
    auto res = repository_->RotatePriorityToBack(*tx, settings.league_id, claim->team_id, ctx.now_ms);
    if (res.code == db::ErrorCode::NotFound) {
      ROSTER_LOG_WARN("team has no priority rank to rotate", {observability::StringField("league_id", settings.league_id),
                                                              observability::StringField("team_id", claim->team_id)});
    } else {
      ThrowIfDbError(res, "rotate priority");
    }
  }

  tx->Commit();
  outcomes.push_back(OutcomeOf(*claim, ClaimStatus::kSuccessful, ""));
  return Step::kResolved;
}

std::vector<ClaimOutcome> ClaimProcessor::ProcessClaims(const std::string& league_id, std::size_t batch_size) {
  observability::SpanScope span("ClaimProcessor.ProcessClaims");
  span.SetAttribute("league_id", league_id);
  const auto started_at = std::chrono::steady_clock::now();

  if (batch_size == 0) batch_size = options_.batch_size;

  std::vector<ClaimOutcome> outcomes;
  if (league_id.empty()) return outcomes;

  std::size_t skipped = 0;
  try {
    auto lock = repository_->TryLockLeague(league_id);
    if (!lock) {
      ROSTER_LOG_INFO("claim run already in progress", {observability::StringField("league_id", league_id)});
      return outcomes;
    }

    LeagueSettings                      settings;
    std::vector<db::model::ClaimRecord> pending;
    {
      auto tx  = repository_->Begin();
      settings = LoadLeagueSettings(*repository_, *tx, league_id, defaults_);

      auto order = ClaimOrderFor(settings.policy);
      if (!order) {
        tx->Rollback();
        ROSTER_LOG_WARN("claim processing not supported for policy",
                        {observability::StringField("league_id", league_id), observability::StringField("policy", PolicyName(settings.policy))});
        return outcomes;
      }
      pending = repository_->SelectPendingClaims(*tx, league_id, *order, batch_size);
      tx->Commit();
    }

    for (const auto& claim : pending) {
      if (ProcessOne(settings, claim.claim_id, outcomes) == Step::kSkipped) ++skipped;
    }
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    ROSTER_LOG_ERROR("claim run aborted", {observability::StringField("league_id", league_id), observability::StringField("error", e.what()),
                                           observability::IntField("resolved", static_cast<int64_t>(outcomes.size()))});
  }

  auto& metrics = observability::Metrics::Instance();
  std::size_t succeeded = 0;
  for (const auto& outcome : outcomes) {
    metrics.RecordClaimOutcome(ToString(outcome.status));
    if (outcome.status == ClaimStatus::kSuccessful) ++succeeded;
  }
  metrics.ObserveClaimBatchDurationMs(std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());

  ROSTER_LOG_INFO("claim run finished", {observability::StringField("league_id", league_id),
                                         observability::IntField("successful", static_cast<int64_t>(succeeded)),
                                         observability::IntField("failed", static_cast<int64_t>(outcomes.size() - succeeded)),
                                         observability::IntField("skipped", static_cast<int64_t>(skipped))});
  return outcomes;
}

AllLeaguesRun ClaimProcessor::ProcessAllPending(std::size_t batch_size) {
  std::vector<std::string> leagues;
  {
    auto tx = repository_->Begin();
    leagues = repository_->ListLeaguesWithPendingClaims(*tx);
    tx->Commit();
  }

  AllLeaguesRun run;
  for (const auto& league_id : leagues) {
    LeagueRun league_run;
    league_run.league_id = league_id;
    league_run.outcomes  = ProcessClaims(league_id, batch_size);
    run.leagues.push_back(std::move(league_run));
  }
  run.expired_windows_cleared = SweepExpiredWindows();
  return run;
}

uint64_t ClaimProcessor::SweepExpiredWindows() {
  auto tx = repository_->Begin();

  std::set<std::string> league_ids;
  for (const auto& league : repository_->ListLeagues(*tx)) league_ids.insert(league.league_id);
  for (auto& league_id : repository_->ListLeaguesWithPendingClaims(*tx)) league_ids.insert(std::move(league_id));

  uint64_t cleared = 0;
  for (const auto& league_id : league_ids) {
    cleared += expiry_.SweepLapsed(*tx, LoadLeagueSettings(*repository_, *tx, league_id, defaults_));
  }
  tx->Commit();

  if (cleared > 0) {
    ROSTER_LOG_INFO("expired waiver windows cleared", {observability::IntField("count", static_cast<int64_t>(cleared))});
  }
  return cleared;
}

uint64_t ClaimProcessor::NextProcessingAt(uint32_t processing_minute_utc, uint64_t now_ms) {
  const uint64_t day_start = now_ms - now_ms % util::kMillisPerDay;
  const uint64_t today     = day_start + static_cast<uint64_t>(processing_minute_utc) * util::kMillisPerMinute;
  return now_ms < today ? today : today + util::kMillisPerDay;
}

bool ClaimProcessor::ShouldProcessNow(const std::string& league_id) {
  auto       tx       = repository_->Begin();
  const auto settings = LoadLeagueSettings(*repository_, *tx, league_id, defaults_);
  const auto pending  = repository_->CountPendingClaims(*tx, league_id);
  const auto last     = repository_->LastClaimProcessedAt(*tx, league_id);
  tx->Commit();

  if (pending == 0) return false;

  const auto now       = clock_();
  const auto day_start = now - now % util::kMillisPerDay;
  auto       opens_at  = day_start + static_cast<uint64_t>(settings.processing_minute_utc) * util::kMillisPerMinute;
  // A window opened late yesterday may still be running after midnight.
  if (now < opens_at) opens_at -= util::kMillisPerDay;
  if (now >= opens_at + options_.processing_window_ms) return false;

  return !last || *last < opens_at;
}

std::vector<std::string> ClaimProcessor::DueLeagues() {
  std::vector<std::string> leagues;
  {
    auto tx = repository_->Begin();
    leagues = repository_->ListLeaguesWithPendingClaims(*tx);
    tx->Commit();
  }

  std::vector<std::string> due;
  for (auto& league_id : leagues) {
    if (ShouldProcessNow(league_id)) due.push_back(std::move(league_id));
  }
  return due;
}

LeagueProcessingStatus ClaimProcessor::StatusFor(db::Transaction& tx, const LeagueSettings& settings, uint64_t now_ms) {
  LeagueProcessingStatus status;
  status.league_id             = settings.league_id;
  status.policy                = PolicyName(settings.policy);
  status.pending_claims        = repository_->CountPendingClaims(tx, settings.league_id);
  status.last_processed_at_ms  = repository_->LastClaimProcessedAt(tx, settings.league_id);
  status.next_processing_at_ms = NextProcessingAt(settings.processing_minute_utc, now_ms);
  return status;
}

std::vector<LeagueProcessingStatus> ClaimProcessor::ProcessingStatus(const std::string& league_id) {
  const auto now = clock_();
  auto       tx  = repository_->Begin();

  std::vector<LeagueProcessingStatus> out;
  if (!league_id.empty()) {
    out.push_back(StatusFor(*tx, LoadLeagueSettings(*repository_, *tx, league_id, defaults_), now));
  } else {
    std::set<std::string> seen;
    for (const auto& league : repository_->ListLeagues(*tx)) {
      seen.insert(league.league_id);
      out.push_back(StatusFor(*tx, FromRecord(league), now));
    }
    for (const auto& pending_league : repository_->ListLeaguesWithPendingClaims(*tx)) {
      if (seen.count(pending_league)) continue;
      out.push_back(StatusFor(*tx, LoadLeagueSettings(*repository_, *tx, pending_league, defaults_), now));
    }
  }
  tx->Commit();
  return out;
}

} // namespace roster::ledger
