#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/ledger/expiry_tracker.hpp"
#include "internal/ledger/failure_sink.hpp"
#include "internal/ledger/league_settings.hpp"
#include "internal/ledger/lineup_projection.hpp"
#include "internal/ledger/ownership_ledger.hpp"
#include "internal/ledger/types.hpp"
#include "internal/util/time.hpp"

namespace roster::ledger {

// One team's release and/or acquire, applied inside a caller's transaction.
struct MoveContext {
  LeagueSettings             settings;
  std::string                team_id;
  std::string                user_id;
  std::optional<std::string> release_player_id;
  std::optional<std::string> acquire_player_id;
  std::string                source;
  uint64_t                   now_ms = 0;

  // Direct adds are refused while the player is on waivers; claims are not.
  bool enforce_cooldown = true;
};

struct AppliedMove {
  MoveResult       result;
  FailureOperation operation = FailureOperation::kUnknown; // set when !result.ok()
  std::string      detail;
};

struct MoveBatchSummary {
  std::vector<MoveResult> results;
  uint32_t                succeeded = 0;
  uint32_t                failed    = 0;
};

/*
  Atomic move executor.

  Execute() runs release-then-acquire as one transaction. Any rejection
  rolls the whole transaction back (a duplicate acquire also undoes the
  release), then records a failed attempt in a separate transaction.
  Validation failures (no team, no player) are returned without touching
  the store's audit tables.

  Execute() never throws; store errors are reported as MoveStatus::kError.
*/
class MoveExecutor {
 public:
  MoveExecutor(std::shared_ptr<db::Repository> repository, LeagueDefaults defaults, util::ClockFn clock = util::NowMs);

  MoveResult Execute(const MoveRequest& request);

  // Independent moves, each in its own transaction.
  MoveBatchSummary ExecuteBatch(const std::vector<MoveRequest>& requests);

  // Shared by the claim processor. The caller commits on success and must
  // roll back otherwise. Store exceptions propagate.
  AppliedMove Apply(db::Transaction& tx, const MoveContext& ctx);

  FailureSink& Failures() {
    return failures_;
  }

 private:
  AppliedMove ApplyRelease(db::Transaction& tx, const MoveContext& ctx);
  AppliedMove ApplyAcquire(db::Transaction& tx, const MoveContext& ctx);

  std::shared_ptr<db::Repository> repository_;
  LeagueDefaults                  defaults_;
  util::ClockFn                   clock_;

  OwnershipLedger  ledger_;
  ExpiryTracker    expiry_;
  LineupProjection projection_;
  FailureSink      failures_;
};

} // namespace roster::ledger
