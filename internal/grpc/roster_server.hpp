#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/roster_service.hpp"
#include "roster/ledger/v1/roster_service.grpc.pb.h"

namespace roster::grpc {

class RosterServer final : public roster::ledger::v1::RosterService::Service {
 public:
  explicit RosterServer(std::shared_ptr<roster::service::RosterService> svc);

  ::grpc::Status ExecuteMove(::grpc::ServerContext*, const roster::ledger::v1::ExecuteMoveRequest*, roster::ledger::v1::ExecuteMoveResponse*) override;
  ::grpc::Status ExecuteMoves(::grpc::ServerContext*, const roster::ledger::v1::ExecuteMovesRequest*, roster::ledger::v1::ExecuteMovesResponse*) override;
  ::grpc::Status AddPlayer(::grpc::ServerContext*, const roster::ledger::v1::AddPlayerRequest*, roster::ledger::v1::AddPlayerResponse*) override;
  ::grpc::Status SubmitClaim(::grpc::ServerContext*, const roster::ledger::v1::SubmitClaimRequest*, roster::ledger::v1::SubmitClaimResponse*) override;
  ::grpc::Status CancelClaim(::grpc::ServerContext*, const roster::ledger::v1::CancelClaimRequest*, roster::ledger::v1::CancelClaimResponse*) override;
  ::grpc::Status ListClaims(::grpc::ServerContext*, const roster::ledger::v1::ListClaimsRequest*, roster::ledger::v1::ListClaimsResponse*) override;
  ::grpc::Status ProcessClaims(::grpc::ServerContext*, const roster::ledger::v1::ProcessClaimsRequest*, roster::ledger::v1::ProcessClaimsResponse*) override;
  ::grpc::Status ProcessAllPendingClaims(::grpc::ServerContext*, const roster::ledger::v1::ProcessAllPendingClaimsRequest*, roster::ledger::v1::ProcessAllPendingClaimsResponse*) override;
  ::grpc::Status CheckAvailability(::grpc::ServerContext*, const roster::ledger::v1::CheckAvailabilityRequest*, roster::ledger::v1::CheckAvailabilityResponse*) override;
  ::grpc::Status GetRoster(::grpc::ServerContext*, const roster::ledger::v1::GetRosterRequest*, roster::ledger::v1::GetRosterResponse*) override;
  ::grpc::Status GetPriorityOrder(::grpc::ServerContext*, const roster::ledger::v1::GetPriorityOrderRequest*, roster::ledger::v1::GetPriorityOrderResponse*) override;
  ::grpc::Status GetTransactionHistory(::grpc::ServerContext*, const roster::ledger::v1::GetTransactionHistoryRequest*, roster::ledger::v1::GetTransactionHistoryResponse*) override;

 private:
  std::shared_ptr<roster::service::RosterService> service_;
};

} // namespace roster::grpc
