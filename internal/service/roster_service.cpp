#include "roster_service.hpp"

#include <algorithm>

#include "internal/db/api/repository.hpp"
#include "internal/ledger/claim_book.hpp"
#include "internal/ledger/claim_processor.hpp"
#include "internal/ledger/move_executor.hpp"
#include "internal/service/proto_mapping.hpp"
#include "internal/service/rpc_observer.hpp"
#include "internal/util/errors.hpp"

namespace roster::service {

using namespace roster::ledger::v1;

namespace {

constexpr uint32_t kMaxMovesPerBatch = 100;
constexpr uint32_t kMaxClaimBatch    = 1000;

void RequireLeague(const std::string& league_id) {
  if (league_id.empty()) {
    throw roster::util::InvalidArgument("league_id is required");
  }
}

roster::ledger::ClaimRequest ToClaimRequest(const std::string& league_id, const std::string& user_id, const std::string& player_id,
                                            const std::optional<std::string>& release_player_id) {
  roster::ledger::ClaimRequest request;
  request.league_id         = league_id;
  request.user_id           = user_id;
  request.player_id         = player_id;
  request.release_player_id = release_player_id;
  return request;
}

} // namespace

RosterService::RosterService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ExecuteMoveResponse RosterService::ExecuteMove(const ExecuteMoveRequest& req) {
  return ObserveRpc("RosterService.ExecuteMove", [&] {
    ExecuteMoveResponse resp;
    *resp.mutable_result() = ToProto(ctx_.executor->Execute(FromProto(req.move())));
    return resp;
  });
}

ExecuteMovesResponse RosterService::ExecuteMoves(const ExecuteMovesRequest& req) {
  return ObserveRpc("RosterService.ExecuteMoves", [&] {
    if (req.moves_size() > static_cast<int>(kMaxMovesPerBatch)) {
      throw roster::util::ResourceExhausted("at most " + std::to_string(kMaxMovesPerBatch) + " moves per batch");
    }

    std::vector<roster::ledger::MoveRequest> moves;
    moves.reserve(req.moves_size());
    for (const auto& move : req.moves()) moves.push_back(FromProto(move));

    const auto summary = ctx_.executor->ExecuteBatch(moves);

    ExecuteMovesResponse resp;
    resp.set_total(static_cast<uint32_t>(summary.results.size()));
    resp.set_successful(summary.succeeded);
    resp.set_failed(summary.failed);
    for (const auto& result : summary.results) *resp.add_results() = ToProto(result);
    return resp;
  });
}

AddPlayerResponse RosterService::AddPlayer(const AddPlayerRequest& req) {
  return ObserveRpc("RosterService.AddPlayer", [&] {
    std::optional<std::string> release;
    if (req.has_release_player_id() && !req.release_player_id().empty()) release = req.release_player_id();

    const auto result = ctx_.claims->AddPlayer(ToClaimRequest(req.league_id(), req.user_id(), req.player_id(), release));

    AddPlayerResponse resp;
    if (result.claim) {
      *resp.mutable_claim() = ToProto(*result.claim);
    } else if (result.move) {
      *resp.mutable_move() = ToProto(*result.move);
    }
    return resp;
  });
}

SubmitClaimResponse RosterService::SubmitClaim(const SubmitClaimRequest& req) {
  return ObserveRpc("RosterService.SubmitClaim", [&] {
    std::optional<std::string> release;
    if (req.has_release_player_id() && !req.release_player_id().empty()) release = req.release_player_id();

    SubmitClaimResponse resp;
    *resp.mutable_claim() = ToProto(ctx_.claims->SubmitClaim(ToClaimRequest(req.league_id(), req.user_id(), req.player_id(), release)));
    return resp;
  });
}

CancelClaimResponse RosterService::CancelClaim(const CancelClaimRequest& req) {
  return ObserveRpc("RosterService.CancelClaim", [&] {
    CancelClaimResponse resp;
    *resp.mutable_claim() = ToProto(ctx_.claims->CancelClaim(req.claim_id(), req.user_id()));
    return resp;
  });
}

ListClaimsResponse RosterService::ListClaims(const ListClaimsRequest& req) {
  return ObserveRpc("RosterService.ListClaims", [&] {
    roster::db::ClaimFilter filter;
    filter.league_id = req.league_id();
    if (!req.team_id().empty()) filter.team_id = req.team_id();
    switch (req.status()) {
      case CLAIM_STATUS_PENDING:
        filter.status = roster::ledger::ToString(roster::ledger::ClaimStatus::kPending);
        break;
      case CLAIM_STATUS_SUCCESSFUL:
        filter.status = roster::ledger::ToString(roster::ledger::ClaimStatus::kSuccessful);
        break;
      case CLAIM_STATUS_FAILED:
        filter.status = roster::ledger::ToString(roster::ledger::ClaimStatus::kFailed);
        break;
      case CLAIM_STATUS_CANCELLED:
        filter.status = roster::ledger::ToString(roster::ledger::ClaimStatus::kCancelled);
        break;
      default:
        break;
    }
    filter.limit = req.limit();

    ListClaimsResponse resp;
    for (const auto& claim : ctx_.claims->ListClaims(filter)) *resp.add_claims() = ToProto(claim);
    return resp;
  });
}

ProcessClaimsResponse RosterService::ProcessClaims(const ProcessClaimsRequest& req) {
  return ObserveRpc("RosterService.ProcessClaims", [&] {
    RequireLeague(req.league_id());
    const auto batch_size = std::min(req.batch_size(), kMaxClaimBatch);

    ProcessClaimsResponse resp;
    for (const auto& outcome : ctx_.processor->ProcessClaims(req.league_id(), batch_size)) *resp.add_outcomes() = ToProto(outcome);
    return resp;
  });
}

ProcessAllPendingClaimsResponse RosterService::ProcessAllPendingClaims(const ProcessAllPendingClaimsRequest&) {
  return ObserveRpc("RosterService.ProcessAllPendingClaims", [&] {
    const auto run = ctx_.processor->ProcessAllPending();

    ProcessAllPendingClaimsResponse resp;
    for (const auto& league : run.leagues) *resp.add_leagues() = ToProto(league);
    resp.set_expired_windows_cleared(run.expired_windows_cleared);
    return resp;
  });
}

CheckAvailabilityResponse RosterService::CheckAvailability(const CheckAvailabilityRequest& req) {
  return ObserveRpc("RosterService.CheckAvailability", [&] {
    CheckAvailabilityResponse resp;
    *resp.mutable_availability() = ToProto(ctx_.claims->CheckAvailability(req.league_id(), req.player_id()));
    return resp;
  });
}

GetRosterResponse RosterService::GetRoster(const GetRosterRequest& req) {
  return ObserveRpc("RosterService.GetRoster", [&] {
    RequireLeague(req.league_id());
    if (req.team_id().empty()) {
      throw roster::util::InvalidArgument("team_id is required");
    }

    auto tx   = ctx_.repository->Begin();
    auto team = ctx_.repository->GetTeam(*tx, req.team_id());
    if (!team || team->league_id != req.league_id()) {
      throw roster::util::NotFound("team not found: " + req.team_id());
    }
    const auto settings    = roster::ledger::LoadLeagueSettings(*ctx_.repository, *tx, req.league_id(), ctx_.league_defaults);
    const auto assignments = ctx_.repository->ListAssignments(*tx, req.league_id(), req.team_id());
    tx->Commit();

    GetRosterResponse resp;
    for (const auto& assignment : assignments) {
      auto* slot = resp.add_players();
      slot->set_player_id(assignment.player_id);
      slot->set_acquired_at_ms(assignment.acquired_at_ms);
    }
    resp.set_max_roster_size(settings.max_roster_size);
    return resp;
  });
}

GetPriorityOrderResponse RosterService::GetPriorityOrder(const GetPriorityOrderRequest& req) {
  return ObserveRpc("RosterService.GetPriorityOrder", [&] {
    RequireLeague(req.league_id());

    auto       tx      = ctx_.repository->Begin();
    const auto entries = ctx_.repository->ListPriorities(*tx, req.league_id());
    tx->Commit();

    GetPriorityOrderResponse resp;
    for (const auto& entry : entries) {
      auto* out = resp.add_entries();
      out->set_team_id(entry.team_id);
      out->set_rank(entry.rank);
    }
    return resp;
  });
}

GetTransactionHistoryResponse RosterService::GetTransactionHistory(const GetTransactionHistoryRequest& req) {
  return ObserveRpc("RosterService.GetTransactionHistory", [&] {
    RequireLeague(req.league_id());

    auto       tx      = ctx_.repository->Begin();
    const auto entries = ctx_.repository->ListLedgerEntries(*tx, req.league_id());
    tx->Commit();

    GetTransactionHistoryResponse resp;
    for (const auto& entry : entries) *resp.add_entries() = ToProto(entry);
    return resp;
  });
}

} // namespace roster::service
