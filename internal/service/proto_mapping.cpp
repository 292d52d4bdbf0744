#include "proto_mapping.hpp"

namespace roster::service {

namespace v1 = roster::ledger::v1;
using roster::ledger::ClaimStatus;
using roster::ledger::MoveStatus;

v1::MoveStatus ToProto(MoveStatus status) {
  switch (status) {
    case MoveStatus::kSuccess:
      return v1::MOVE_STATUS_SUCCESS;
    case MoveStatus::kDuplicatePlayer:
      return v1::MOVE_STATUS_DUPLICATE_PLAYER;
    case MoveStatus::kRosterFull:
      return v1::MOVE_STATUS_ROSTER_FULL;
    case MoveStatus::kNotOwned:
      return v1::MOVE_STATUS_NOT_OWNED;
    case MoveStatus::kNoTeam:
      return v1::MOVE_STATUS_NO_TEAM;
    case MoveStatus::kError:
      return v1::MOVE_STATUS_ERROR;
  }
  return v1::MOVE_STATUS_ERROR;
}

v1::ClaimStatus ToProto(ClaimStatus status) {
  switch (status) {
    case ClaimStatus::kPending:
      return v1::CLAIM_STATUS_PENDING;
    case ClaimStatus::kSuccessful:
      return v1::CLAIM_STATUS_SUCCESSFUL;
    case ClaimStatus::kFailed:
      return v1::CLAIM_STATUS_FAILED;
    case ClaimStatus::kCancelled:
      return v1::CLAIM_STATUS_CANCELLED;
  }
  return v1::CLAIM_STATUS_UNSPECIFIED;
}

v1::MoveResult ToProto(const roster::ledger::MoveResult& result) {
  v1::MoveResult out;
  out.set_status(ToProto(result.status));
  out.set_reason(result.reason);
  return out;
}

v1::Claim ToProto(const roster::db::model::ClaimRecord& claim) {
  v1::Claim out;
  out.set_claim_id(claim.claim_id);
  out.set_league_id(claim.league_id);
  out.set_team_id(claim.team_id);
  out.set_player_id(claim.player_id);
  if (claim.release_player_id) out.set_release_player_id(*claim.release_player_id);
  out.set_priority_snapshot(claim.priority_snapshot);
  if (auto status = roster::ledger::ParseClaimStatus(claim.status)) {
    out.set_status(ToProto(*status));
  }
  out.set_created_at_ms(claim.created_at_ms);
  out.set_processed_at_ms(claim.processed_at_ms);
  out.set_failure_reason(claim.failure_reason);
  return out;
}

v1::ClaimOutcome ToProto(const roster::ledger::ClaimOutcome& outcome) {
  v1::ClaimOutcome out;
  out.set_claim_id(outcome.claim_id);
  out.set_team_id(outcome.team_id);
  out.set_player_id(outcome.player_id);
  out.set_status(ToProto(outcome.status));
  out.set_reason(outcome.reason);
  return out;
}

v1::LedgerEntry ToProto(const roster::db::model::LedgerEntryRecord& entry) {
  v1::LedgerEntry out;
  out.set_entry_id(entry.entry_id);
  out.set_team_id(entry.team_id);
  out.set_user_id(entry.user_id);
  out.set_kind(entry.kind);
  out.set_player_id(entry.player_id);
  out.set_source(entry.source);
  out.set_created_at_ms(entry.created_at_ms);
  return out;
}

v1::PlayerAvailability ToProto(const roster::ledger::Availability& availability) {
  v1::PlayerAvailability out;
  out.set_player_id(availability.player_id);
  out.set_available(availability.available);
  out.set_owner_team_id(availability.owner_team_id);
  out.set_on_waivers(availability.on_waivers);
  out.set_waivers_clear_at_ms(availability.waivers_clear_at_ms.value_or(0));
  out.set_reason(availability.reason);
  return out;
}

v1::LeagueProcessingStatus ToProto(const roster::ledger::LeagueProcessingStatus& status) {
  v1::LeagueProcessingStatus out;
  out.set_league_id(status.league_id);
  out.set_pending_claims(status.pending_claims);
  out.set_last_processed_at_ms(status.last_processed_at_ms.value_or(0));
  out.set_next_processing_at_ms(status.next_processing_at_ms);
  return out;
}

v1::LeagueRunSummary ToProto(const roster::ledger::LeagueRun& run) {
  v1::LeagueRunSummary out;
  out.set_league_id(run.league_id);
  uint32_t successful = 0;
  for (const auto& outcome : run.outcomes) {
    if (outcome.status == ClaimStatus::kSuccessful) ++successful;
    *out.add_outcomes() = ToProto(outcome);
  }
  out.set_total(static_cast<uint32_t>(run.outcomes.size()));
  out.set_successful(successful);
  out.set_failed(out.total() - successful);
  return out;
}

roster::ledger::MoveRequest FromProto(const v1::Move& move) {
  roster::ledger::MoveRequest out;
  out.league_id = move.league_id();
  out.user_id   = move.user_id();
  if (move.has_release_player_id() && !move.release_player_id().empty()) out.release_player_id = move.release_player_id();
  if (move.has_acquire_player_id() && !move.acquire_player_id().empty()) out.acquire_player_id = move.acquire_player_id();
  if (!move.source().empty()) out.source = move.source();
  return out;
}

std::optional<roster::ledger::PriorityPolicy> FromProto(v1::PriorityPolicy policy) {
  switch (policy) {
    case v1::PRIORITY_POLICY_ROTATING:
      return roster::ledger::RotatingPolicy{};
    case v1::PRIORITY_POLICY_REVERSE_STANDINGS:
      return roster::ledger::ReverseStandingsPolicy{};
    case v1::PRIORITY_POLICY_BUDGET_BID:
      return roster::ledger::BudgetBidPolicy{};
    default:
      return std::nullopt;
  }
}

v1::PriorityPolicy ToProto(const roster::ledger::PriorityPolicy& policy) {
  if (std::holds_alternative<roster::ledger::ReverseStandingsPolicy>(policy)) return v1::PRIORITY_POLICY_REVERSE_STANDINGS;
  if (std::holds_alternative<roster::ledger::BudgetBidPolicy>(policy)) return v1::PRIORITY_POLICY_BUDGET_BID;
  return v1::PRIORITY_POLICY_ROTATING;
}

} // namespace roster::service
