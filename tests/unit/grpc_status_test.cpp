#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/roster_server.hpp"
#include "internal/ledger/claim_book.hpp"
#include "internal/ledger/claim_processor.hpp"
#include "internal/ledger/move_executor.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/roster_service.hpp"
#include "internal/service/service_context.hpp"
#include "tests/support/ledger_fixture.hpp"

namespace {

roster::service::ServiceContext BuildServiceContext() {
  auto repository = std::make_shared<roster::db::memory::MemoryRepository>();
  roster::testing::SeedLeague(*repository, "L1");
  roster::testing::SeedTeam(*repository, "L1", "T1", "u1", 1);

  roster::service::ServiceContext ctx;
  ctx.repository = repository;
  ctx.executor   = std::make_shared<roster::ledger::MoveExecutor>(repository, ctx.league_defaults);
  ctx.claims     = std::make_shared<roster::ledger::ClaimBook>(repository, ctx.executor, ctx.league_defaults);
  ctx.processor  = std::make_shared<roster::ledger::ClaimProcessor>(repository, ctx.executor, ctx.league_defaults);
  return ctx;
}

void TestExceptionMapping() {
  using ::grpc::StatusCode;
  using roster::grpc::ToStatus;

  assert(ToStatus(roster::util::NotFound("x")).error_code() == StatusCode::NOT_FOUND);
  assert(ToStatus(roster::util::AlreadyExists("x")).error_code() == StatusCode::ALREADY_EXISTS);
  assert(ToStatus(roster::util::InvalidArgument("x")).error_code() == StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(roster::util::InvalidState("x")).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(roster::util::PermissionDenied("x")).error_code() == StatusCode::PERMISSION_DENIED);
  assert(ToStatus(roster::util::ResourceExhausted("x")).error_code() == StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(roster::util::Unimplemented("x")).error_code() == StatusCode::UNIMPLEMENTED);
  assert(ToStatus(std::runtime_error("boom")).error_code() == StatusCode::INTERNAL);
  assert(ToStatus(roster::util::NotFound("claim not found: c1")).error_message() == "claim not found: c1");
}

void TestCancelMissingClaimReturnsNotFound() {
  auto                       ctx = BuildServiceContext();
  roster::grpc::RosterServer server(std::make_shared<roster::service::RosterService>(ctx));

  roster::ledger::v1::CancelClaimRequest req;
  req.set_claim_id("missing-claim");
  req.set_user_id("u1");
  roster::ledger::v1::CancelClaimResponse resp;
  ::grpc::ServerContext                   grpc_ctx;

  const auto status = server.CancelClaim(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestClaimOnRosteredPlayerReturnsFailedPrecondition() {
  auto ctx = BuildServiceContext();
  roster::testing::SeedRoster(*ctx.repository, "L1", "T1", {"P1"});
  roster::grpc::RosterServer server(std::make_shared<roster::service::RosterService>(ctx));

  roster::ledger::v1::SubmitClaimRequest req;
  req.set_league_id("L1");
  req.set_user_id("u1");
  req.set_player_id("P1");
  roster::ledger::v1::SubmitClaimResponse resp;
  ::grpc::ServerContext                   grpc_ctx;

  const auto status = server.SubmitClaim(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestMoveRejectionIsInTheResponse() {
  auto                       ctx = BuildServiceContext();
  roster::grpc::RosterServer server(std::make_shared<roster::service::RosterService>(ctx));

  roster::ledger::v1::ExecuteMoveRequest req;
  req.mutable_move()->set_league_id("L1");
  req.mutable_move()->set_user_id("u1");
  req.mutable_move()->set_release_player_id("P9");
  roster::ledger::v1::ExecuteMoveResponse resp;
  ::grpc::ServerContext                   grpc_ctx;

  const auto status = server.ExecuteMove(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.result().status() == roster::ledger::v1::MOVE_STATUS_NOT_OWNED);
}

void TestUpsertTeamForMissingLeagueReturnsNotFound() {
  auto                      ctx = BuildServiceContext();
  roster::grpc::AdminServer server(std::make_shared<roster::service::AdminService>(ctx));

  roster::ledger::v1::UpsertTeamRequest req;
  req.set_league_id("nowhere");
  req.set_team_id("T9");
  roster::ledger::v1::UpsertTeamResponse resp;
  ::grpc::ServerContext                  grpc_ctx;

  auto status = server.UpsertTeam(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);

  req.set_team_id("");
  status = server.UpsertTeam(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestCancelMissingClaimReturnsNotFound();
  TestClaimOnRosteredPlayerReturnsFailedPrecondition();
  TestMoveRejectionIsInTheResponse();
  TestUpsertTeamForMissingLeagueReturnsNotFound();

  std::cout << "roster_ledger_unit_grpc_status: pass\n";
  return 0;
}
