#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/ledger/expiry_tracker.hpp"
#include "internal/ledger/league_settings.hpp"
#include "internal/ledger/move_executor.hpp"
#include "internal/ledger/ownership_ledger.hpp"
#include "internal/util/time.hpp"

namespace roster::ledger {

struct ClaimRequest {
  std::string                league_id;
  std::string                user_id;
  std::string                player_id;
  std::optional<std::string> release_player_id;
};

struct Availability {
  std::string             player_id;
  bool                    available = false; // free agent, no waiver window
  std::string             owner_team_id;     // set when rostered
  bool                    on_waivers = false;
  std::optional<uint64_t> waivers_clear_at_ms;
  std::string             reason;
};

// Either a direct move ran, or the player was on waivers and a claim was queued.
struct AddPlayerResult {
  std::optional<MoveResult>              move;
  std::optional<db::model::ClaimRecord> claim;
};

/*
  Claim lifecycle entry points for requesters.

  Errors are reported with the exceptions in internal/util/errors.hpp.
*/
class ClaimBook {
 public:
  static constexpr std::size_t kMaxListLimit = 500;

  ClaimBook(std::shared_ptr<db::Repository> repository, std::shared_ptr<MoveExecutor> executor, LeagueDefaults defaults,
            util::ClockFn clock = util::NowMs);

  db::model::ClaimRecord SubmitClaim(const ClaimRequest& request);

  // Only the team owner may cancel, and only while the claim is pending.
  db::model::ClaimRecord CancelClaim(const std::string& claim_id, const std::string& user_id);

  std::vector<db::model::ClaimRecord> ListClaims(db::ClaimFilter filter);

  Availability CheckAvailability(const std::string& league_id, const std::string& player_id);

  AddPlayerResult AddPlayer(const ClaimRequest& request);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<MoveExecutor>   executor_;
  LeagueDefaults                  defaults_;
  util::ClockFn                   clock_;

  OwnershipLedger ledger_;
  ExpiryTracker   expiry_;
};

} // namespace roster::ledger
