#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/admin_service.hpp"
#include "roster/ledger/v1/admin_service.grpc.pb.h"

namespace roster::grpc {

class AdminServer final : public roster::ledger::v1::RosterAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<roster::service::AdminService> svc);

  ::grpc::Status UpsertLeague(::grpc::ServerContext*, const roster::ledger::v1::UpsertLeagueRequest*, roster::ledger::v1::UpsertLeagueResponse*) override;

  ::grpc::Status UpsertTeam(::grpc::ServerContext*, const roster::ledger::v1::UpsertTeamRequest*, roster::ledger::v1::UpsertTeamResponse*) override;

  ::grpc::Status GetProcessingStatus(::grpc::ServerContext*, const roster::ledger::v1::GetProcessingStatusRequest*,
                                     roster::ledger::v1::GetProcessingStatusResponse*) override;

 private:
  std::shared_ptr<roster::service::AdminService> service_;
};

} // namespace roster::grpc
