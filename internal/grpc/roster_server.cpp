#include "roster_server.hpp"

#include "grpc_error.hpp"

namespace roster::grpc {

using namespace roster::ledger::v1;

namespace {

template <typename Fn>
::grpc::Status Invoke(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

RosterServer::RosterServer(std::shared_ptr<roster::service::RosterService> svc) : service_(std::move(svc)) {
}

::grpc::Status RosterServer::ExecuteMove(::grpc::ServerContext*, const ExecuteMoveRequest* req, ExecuteMoveResponse* resp) {
  return Invoke([&] { *resp = service_->ExecuteMove(*req); });
}

::grpc::Status RosterServer::ExecuteMoves(::grpc::ServerContext*, const ExecuteMovesRequest* req, ExecuteMovesResponse* resp) {
  return Invoke([&] { *resp = service_->ExecuteMoves(*req); });
}

::grpc::Status RosterServer::AddPlayer(::grpc::ServerContext*, const AddPlayerRequest* req, AddPlayerResponse* resp) {
  return Invoke([&] { *resp = service_->AddPlayer(*req); });
}

::grpc::Status RosterServer::SubmitClaim(::grpc::ServerContext*, const SubmitClaimRequest* req, SubmitClaimResponse* resp) {
  return Invoke([&] { *resp = service_->SubmitClaim(*req); });
}

::grpc::Status RosterServer::CancelClaim(::grpc::ServerContext*, const CancelClaimRequest* req, CancelClaimResponse* resp) {
  return Invoke([&] { *resp = service_->CancelClaim(*req); });
}

::grpc::Status RosterServer::ListClaims(::grpc::ServerContext*, const ListClaimsRequest* req, ListClaimsResponse* resp) {
  return Invoke([&] { *resp = service_->ListClaims(*req); });
}

::grpc::Status RosterServer::ProcessClaims(::grpc::ServerContext*, const ProcessClaimsRequest* req, ProcessClaimsResponse* resp) {
  return Invoke([&] { *resp = service_->ProcessClaims(*req); });
}

::grpc::Status RosterServer::ProcessAllPendingClaims(::grpc::ServerContext*, const ProcessAllPendingClaimsRequest* req, ProcessAllPendingClaimsResponse* resp) {
  return Invoke([&] { *resp = service_->ProcessAllPendingClaims(*req); });
}

::grpc::Status RosterServer::CheckAvailability(::grpc::ServerContext*, const CheckAvailabilityRequest* req, CheckAvailabilityResponse* resp) {
  return Invoke([&] { *resp = service_->CheckAvailability(*req); });
}

::grpc::Status RosterServer::GetRoster(::grpc::ServerContext*, const GetRosterRequest* req, GetRosterResponse* resp) {
  return Invoke([&] { *resp = service_->GetRoster(*req); });
}

::grpc::Status RosterServer::GetPriorityOrder(::grpc::ServerContext*, const GetPriorityOrderRequest* req, GetPriorityOrderResponse* resp) {
  return Invoke([&] { *resp = service_->GetPriorityOrder(*req); });
}

::grpc::Status RosterServer::GetTransactionHistory(::grpc::ServerContext*, const GetTransactionHistoryRequest* req, GetTransactionHistoryResponse* resp) {
  return Invoke([&] { *resp = service_->GetTransactionHistory(*req); });
}

} // namespace roster::grpc
