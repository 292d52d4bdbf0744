#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <string>

#include "api/roster/ledger/v1.hpp"
#include "roster/ledger/v1/admin_service.grpc.pb.h"
#include "roster/ledger/v1/roster_service.grpc.pb.h"

using namespace roster::ledger::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  rosterctl <addr> move <league> <user> [add=<player>] [drop=<player>]\n"
            << "  rosterctl <addr> add <league> <user> <player> [drop=<player>]\n"
            << "  rosterctl <addr> claim <league> <user> <player> [drop=<player>]\n"
            << "  rosterctl <addr> cancel <claim_id> <user>\n"
            << "  rosterctl <addr> claims <league> [team=<team>] [status=pending|successful|failed|cancelled]\n"
            << "  rosterctl <addr> process <league> [batch_size]\n"
            << "  rosterctl <addr> process-all\n"
            << "  rosterctl <addr> available <league> <player>\n"
            << "  rosterctl <addr> roster <league> <team>\n"
            << "  rosterctl <addr> priority <league>\n"
            << "  rosterctl <addr> history <league>\n"
            << "  rosterctl <addr> league <league> [name=..] [max_roster=N] [cooldown_hours=N] [policy=rotating|reverse_standings|budget_bid] "
               "[time=HH:MM]\n"
            << "  rosterctl <addr> team <league> <team> [owner=<user>] [name=..] [rank=N]\n"
            << "  rosterctl <addr> status [league]\n";
}

// Collects trailing key=value arguments starting at argv[first].
static std::map<std::string, std::string> ParseOptions(int argc, char** argv, int first) {
  std::map<std::string, std::string> options;
  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto        eq  = arg.find('=');
    if (eq == std::string::npos) {
      std::cerr << "expected key=value, got '" << arg << "'\n";
      std::exit(1);
    }
    options[arg.substr(0, eq)] = arg.substr(eq + 1);
  }
  return options;
}

static std::optional<std::string> Lookup(const std::map<std::string, std::string>& options, const std::string& key) {
  auto it = options.find(key);
  if (it == options.end()) return std::nullopt;
  return it->second;
}

static std::optional<ClaimStatus> ParseClaimStatus(const std::string& value) {
  if (value == "pending") return CLAIM_STATUS_PENDING;
  if (value == "successful") return CLAIM_STATUS_SUCCESSFUL;
  if (value == "failed") return CLAIM_STATUS_FAILED;
  if (value == "cancelled") return CLAIM_STATUS_CANCELLED;
  return std::nullopt;
}

static std::optional<PriorityPolicy> ParsePolicy(const std::string& value) {
  if (value == "rotating") return PRIORITY_POLICY_ROTATING;
  if (value == "reverse_standings") return PRIORITY_POLICY_REVERSE_STANDINGS;
  if (value == "budget_bid") return PRIORITY_POLICY_BUDGET_BID;
  return std::nullopt;
}

static void PrintMoveResult(const MoveResult& result) {
  std::cout << "status=" << MoveStatus_Name(result.status());
  if (!result.reason().empty()) std::cout << " reason=\"" << result.reason() << "\"";
  std::cout << "\n";
}

static void PrintClaim(const Claim& claim) {
  std::cout << claim.claim_id() << " team=" << claim.team_id() << " player=" << claim.player_id();
  if (claim.has_release_player_id()) std::cout << " drop=" << claim.release_player_id();
  std::cout << " snapshot=" << claim.priority_snapshot() << " status=" << ClaimStatus_Name(claim.status());
  if (!claim.failure_reason().empty()) std::cout << " reason=\"" << claim.failure_reason() << "\"";
  std::cout << "\n";
}

static void PrintOutcome(const ClaimOutcome& outcome) {
  std::cout << outcome.claim_id() << " team=" << outcome.team_id() << " player=" << outcome.player_id()
            << " status=" << ClaimStatus_Name(outcome.status());
  if (!outcome.reason().empty()) std::cout << " reason=\"" << outcome.reason() << "\"";
  std::cout << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_code() << ": " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto roster_stub = RosterService::NewStub(channel);
  auto admin_stub  = RosterAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "move") {
    if (argc < 5) return 1;
    const auto options = ParseOptions(argc, argv, 5);

    ExecuteMoveRequest req;
    auto*              move = req.mutable_move();
    move->set_league_id(argv[3]);
    move->set_user_id(argv[4]);
    move->set_source("cli");
    if (auto add = Lookup(options, "add")) move->set_acquire_player_id(*add);
    if (auto drop = Lookup(options, "drop")) move->set_release_player_id(*drop);

    ExecuteMoveResponse resp;
    auto                status = roster_stub->ExecuteMove(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintMoveResult(resp.result());
    return resp.result().status() == MOVE_STATUS_SUCCESS ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "add" || cmd == "claim") {
    if (argc < 6) return 1;
    const auto options = ParseOptions(argc, argv, 6);
    const auto drop    = Lookup(options, "drop");

    if (cmd == "add") {
      AddPlayerRequest req;
      req.set_league_id(argv[3]);
      req.set_user_id(argv[4]);
      req.set_player_id(argv[5]);
      if (drop) req.set_release_player_id(*drop);

      AddPlayerResponse resp;
      auto              status = roster_stub->AddPlayer(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      if (resp.has_claim()) {
        std::cout << "player on waivers, claim submitted\n";
        PrintClaim(resp.claim());
      } else {
        PrintMoveResult(resp.move());
      }
      return 0;
    }

    SubmitClaimRequest req;
    req.set_league_id(argv[3]);
    req.set_user_id(argv[4]);
    req.set_player_id(argv[5]);
    if (drop) req.set_release_player_id(*drop);

    SubmitClaimResponse resp;
    auto                status = roster_stub->SubmitClaim(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintClaim(resp.claim());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 5) return 1;

    CancelClaimRequest req;
    req.set_claim_id(argv[3]);
    req.set_user_id(argv[4]);

    CancelClaimResponse resp;
    auto                status = roster_stub->CancelClaim(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintClaim(resp.claim());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "claims") {
    if (argc < 4) return 1;
    const auto options = ParseOptions(argc, argv, 4);

    ListClaimsRequest req;
    req.set_league_id(argv[3]);
    if (auto team = Lookup(options, "team")) req.set_team_id(*team);
    if (auto value = Lookup(options, "status")) {
      auto parsed = ParseClaimStatus(*value);
      if (!parsed) {
        std::cerr << "unsupported status: " << *value << "\n";
        return 1;
      }
      req.set_status(*parsed);
    }

    ListClaimsResponse resp;
    auto               status = roster_stub->ListClaims(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& claim : resp.claims()) PrintClaim(claim);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "process") {
    if (argc < 4) return 1;

    ProcessClaimsRequest req;
    req.set_league_id(argv[3]);
    if (argc >= 5) req.set_batch_size(static_cast<uint32_t>(std::stoul(argv[4])));

    ProcessClaimsResponse resp;
    auto                  status = roster_stub->ProcessClaims(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& outcome : resp.outcomes()) PrintOutcome(outcome);
    std::cout << "processed=" << resp.outcomes_size() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "process-all") {
    ProcessAllPendingClaimsRequest  req;
    ProcessAllPendingClaimsResponse resp;
    auto                            status = roster_stub->ProcessAllPendingClaims(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& league : resp.leagues()) {
      std::cout << league.league_id() << " total=" << league.total() << " successful=" << league.successful() << " failed=" << league.failed()
                << "\n";
    }
    std::cout << "expired_windows_cleared=" << resp.expired_windows_cleared() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "available") {
    if (argc < 5) return 1;

    CheckAvailabilityRequest req;
    req.set_league_id(argv[3]);
    req.set_player_id(argv[4]);

    CheckAvailabilityResponse resp;
    auto                      status = roster_stub->CheckAvailability(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    const auto& a = resp.availability();
    std::cout << "available=" << (a.available() ? "true" : "false") << " on_waivers=" << (a.on_waivers() ? "true" : "false");
    if (!a.owner_team_id().empty()) std::cout << " owner=" << a.owner_team_id();
    if (a.waivers_clear_at_ms() > 0) std::cout << " clears_at_ms=" << a.waivers_clear_at_ms();
    if (!a.reason().empty()) std::cout << " reason=\"" << a.reason() << "\"";
    std::cout << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "roster") {
    if (argc < 5) return 1;

    GetRosterRequest req;
    req.set_league_id(argv[3]);
    req.set_team_id(argv[4]);

    GetRosterResponse resp;
    auto              status = roster_stub->GetRoster(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& slot : resp.players()) std::cout << slot.player_id() << " acquired_at_ms=" << slot.acquired_at_ms() << "\n";
    std::cout << "size=" << resp.players_size() << "/" << resp.max_roster_size() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "priority") {
    if (argc < 4) return 1;

    GetPriorityOrderRequest req;
    req.set_league_id(argv[3]);

    GetPriorityOrderResponse resp;
    auto                     status = roster_stub->GetPriorityOrder(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& entry : resp.entries()) std::cout << entry.rank() << " " << entry.team_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "history") {
    if (argc < 4) return 1;

    GetTransactionHistoryRequest req;
    req.set_league_id(argv[3]);

    GetTransactionHistoryResponse resp;
    auto                          status = roster_stub->GetTransactionHistory(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& entry : resp.entries()) {
      std::cout << entry.entry_id() << " " << entry.kind() << " team=" << entry.team_id() << " player=" << entry.player_id()
                << " source=" << entry.source() << " at_ms=" << entry.created_at_ms() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "league") {
    if (argc < 4) return 1;
    const auto options = ParseOptions(argc, argv, 4);

    UpsertLeagueRequest req;
    auto*               settings = req.mutable_settings();
    settings->set_league_id(argv[3]);
    if (auto name = Lookup(options, "name")) settings->set_name(*name);
    if (auto max = Lookup(options, "max_roster")) settings->set_max_roster_size(static_cast<uint32_t>(std::stoul(*max)));
    if (auto hours = Lookup(options, "cooldown_hours")) settings->set_cooldown_hours(static_cast<uint32_t>(std::stoul(*hours)));
    if (auto time = Lookup(options, "time")) settings->set_processing_time_utc(*time);
    if (auto value = Lookup(options, "policy")) {
      auto parsed = ParsePolicy(*value);
      if (!parsed) {
        std::cerr << "unsupported policy: " << *value << "\n";
        return 1;
      }
      settings->set_priority_policy(*parsed);
    }

    UpsertLeagueResponse resp;
    auto                 status = admin_stub->UpsertLeague(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    const auto& stored = resp.settings();
    std::cout << stored.league_id() << " max_roster=" << stored.max_roster_size() << " cooldown_hours=" << stored.cooldown_hours()
              << " policy=" << PriorityPolicy_Name(stored.priority_policy()) << " time=" << stored.processing_time_utc() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "team") {
    if (argc < 5) return 1;
    const auto options = ParseOptions(argc, argv, 5);

    UpsertTeamRequest req;
    req.set_league_id(argv[3]);
    req.set_team_id(argv[4]);
    if (auto owner = Lookup(options, "owner")) req.set_owner_user_id(*owner);
    if (auto name = Lookup(options, "name")) req.set_name(*name);
    if (auto rank = Lookup(options, "rank")) req.set_priority_rank(static_cast<uint32_t>(std::stoul(*rank)));

    UpsertTeamResponse resp;
    auto               status = admin_stub->UpsertTeam(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.team_id() << " rank=" << resp.priority_rank() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    GetProcessingStatusRequest req;
    if (argc >= 4) req.set_league_id(argv[3]);

    GetProcessingStatusResponse resp;
    auto                        status = admin_stub->GetProcessingStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& league : resp.leagues()) {
      std::cout << league.league_id() << " pending=" << league.pending_claims() << " last_processed_at_ms=" << league.last_processed_at_ms()
                << " next_processing_at_ms=" << league.next_processing_at_ms() << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
