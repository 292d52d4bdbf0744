#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace roster::grpc {

using namespace roster::ledger::v1;

AdminServer::AdminServer(std::shared_ptr<roster::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::UpsertLeague(::grpc::ServerContext*, const UpsertLeagueRequest* req, UpsertLeagueResponse* resp) {
  try {
    *resp = service_->UpsertLeague(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::UpsertTeam(::grpc::ServerContext*, const UpsertTeamRequest* req, UpsertTeamResponse* resp) {
  try {
    *resp = service_->UpsertTeam(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetProcessingStatus(::grpc::ServerContext*, const GetProcessingStatusRequest* req, GetProcessingStatusResponse* resp) {
  try {
    *resp = service_->GetProcessingStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace roster::grpc
