#pragma once

#include "api/roster/ledger/v1.hpp"
#include "internal/util/time.hpp"
#include "service_context.hpp"

namespace roster::service {

/*
  League and team seeding plus processing status. The ledger treats leagues
  and teams as upstream data; this is the path that writes them.
*/
class AdminService {
 public:
  explicit AdminService(ServiceContext ctx, roster::util::ClockFn clock = roster::util::NowMs);

  roster::ledger::v1::UpsertLeagueResponse        UpsertLeague(const roster::ledger::v1::UpsertLeagueRequest& req);
  roster::ledger::v1::UpsertTeamResponse          UpsertTeam(const roster::ledger::v1::UpsertTeamRequest& req);
  roster::ledger::v1::GetProcessingStatusResponse GetProcessingStatus(const roster::ledger::v1::GetProcessingStatusRequest& req);

 private:
  ServiceContext        ctx_;
  roster::util::ClockFn clock_;
};

} // namespace roster::service
