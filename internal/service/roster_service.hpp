#pragma once

#include "api/roster/ledger/v1.hpp"
#include "service_context.hpp"

namespace roster::service {

class RosterService {
 public:
  explicit RosterService(ServiceContext ctx);

  roster::ledger::v1::ExecuteMoveResponse  ExecuteMove(const roster::ledger::v1::ExecuteMoveRequest& req);
  roster::ledger::v1::ExecuteMovesResponse ExecuteMoves(const roster::ledger::v1::ExecuteMovesRequest& req);
  roster::ledger::v1::AddPlayerResponse    AddPlayer(const roster::ledger::v1::AddPlayerRequest& req);

  roster::ledger::v1::SubmitClaimResponse   SubmitClaim(const roster::ledger::v1::SubmitClaimRequest& req);
  roster::ledger::v1::CancelClaimResponse   CancelClaim(const roster::ledger::v1::CancelClaimRequest& req);
  roster::ledger::v1::ListClaimsResponse    ListClaims(const roster::ledger::v1::ListClaimsRequest& req);
  roster::ledger::v1::ProcessClaimsResponse ProcessClaims(const roster::ledger::v1::ProcessClaimsRequest& req);
  roster::ledger::v1::ProcessAllPendingClaimsResponse ProcessAllPendingClaims(const roster::ledger::v1::ProcessAllPendingClaimsRequest& req);

  roster::ledger::v1::CheckAvailabilityResponse     CheckAvailability(const roster::ledger::v1::CheckAvailabilityRequest& req);
  roster::ledger::v1::GetRosterResponse             GetRoster(const roster::ledger::v1::GetRosterRequest& req);
  roster::ledger::v1::GetPriorityOrderResponse      GetPriorityOrder(const roster::ledger::v1::GetPriorityOrderRequest& req);
  roster::ledger::v1::GetTransactionHistoryResponse GetTransactionHistory(const roster::ledger::v1::GetTransactionHistoryRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace roster::service
