#pragma once

#include <cstddef>
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
#include "internal/ledger/types.hpp"
#include "internal/util/time.hpp"

namespace roster::ledger {

struct ClaimProcessorOptions {
  std::size_t batch_size = 100;

  // How long after a league's daily processing time a run is still due.
  uint64_t processing_window_ms = 5 * util::kMillisPerMinute;
};

struct LeagueRun {
  std::string               league_id;
  std::vector<ClaimOutcome> outcomes;
};

struct AllLeaguesRun {
  std::vector<LeagueRun> leagues;
  uint64_t               expired_windows_cleared = 0;
};

struct LeagueProcessingStatus {
  std::string             league_id;
  std::string             policy;
  uint64_t                pending_claims = 0;
  std::optional<uint64_t> last_processed_at_ms;
  uint64_t                next_processing_at_ms = 0;
};

/*
  Contested-resource batch processor.

  One run per league at a time: TryLockLeague gives up immediately when
  another run holds the league, and the second caller gets an empty list.

  Each claim is resolved in its own transaction:
    lock claim row (skip if no longer pending)
    -> team owner
    -> lock team lineup row
    -> skip-locked ownership probe
    -> roster cap
    -> shared move apply
  A claim-level rejection fails only that claim. A store failure outside
  the move stops the run; claims already resolved stay resolved.

  Waiver windows do not block claims.
*/
class ClaimProcessor {
 public:
  ClaimProcessor(std::shared_ptr<db::Repository> repository, std::shared_ptr<MoveExecutor> executor, LeagueDefaults defaults,
                 ClaimProcessorOptions options = {}, util::ClockFn clock = util::NowMs);

  // batch_size 0 uses the configured default.
  std::vector<ClaimOutcome> ProcessClaims(const std::string& league_id, std::size_t batch_size = 0);

  // Every league with pending claims, then a sweep of lapsed waiver windows.
  AllLeaguesRun ProcessAllPending(std::size_t batch_size = 0);

  // Due when the league has pending claims, the current time is inside the
  // processing window, and no claim was processed since the window opened.
  bool ShouldProcessNow(const std::string& league_id);

  std::vector<std::string> DueLeagues();

  uint64_t SweepExpiredWindows();

  // Empty league_id reports every known league.
  std::vector<LeagueProcessingStatus> ProcessingStatus(const std::string& league_id = {});

  static uint64_t NextProcessingAt(uint32_t processing_minute_utc, uint64_t now_ms);

 private:
  enum class Step { kResolved, kSkipped };

  Step ProcessOne(const LeagueSettings& settings, const std::string& claim_id, std::vector<ClaimOutcome>& outcomes);

  ClaimOutcome RejectLocked(db::Transaction& tx, const db::model::ClaimRecord& claim, const std::string& reason);
  std::optional<ClaimOutcome> RejectAfterRollback(const db::model::ClaimRecord& claim, const AppliedMove& applied);

  void RecordFailure(const db::model::ClaimRecord& claim, const std::string& user_id, FailureOperation op, const std::string& reason,
                     const std::string& detail);

  LeagueProcessingStatus StatusFor(db::Transaction& tx, const LeagueSettings& settings, uint64_t now_ms);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<MoveExecutor>   executor_;
  LeagueDefaults                  defaults_;
  ClaimProcessorOptions           options_;
  util::ClockFn                   clock_;

  OwnershipLedger ledger_;
  ExpiryTracker   expiry_;
};

} // namespace roster::ledger
