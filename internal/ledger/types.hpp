#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace roster::ledger {

enum class MoveStatus {
  kSuccess,
  kDuplicatePlayer,
  kRosterFull,
  kNotOwned,
  kNoTeam,
  kError,
};

// "success", "duplicate_player", "roster_full", "not_owned", "no_team", "error"
const char* ToString(MoveStatus status);

struct MoveRequest {
  std::string                league_id;
  std::string                user_id;
  std::optional<std::string> release_player_id;
  std::optional<std::string> acquire_player_id;
  std::string                source = "web";
};

struct MoveResult {
  MoveStatus  status = MoveStatus::kSuccess;
  std::string reason;  // empty on success
  std::string team_id; // empty when the caller has no team

  bool ok() const {
    return status == MoveStatus::kSuccess;
  }
};

enum class ClaimStatus {
  kPending,
  kSuccessful,
  kFailed,
  kCancelled,
};

// Matches the waiver_claims.status column.
const char*                ToString(ClaimStatus status);
std::optional<ClaimStatus> ParseClaimStatus(std::string_view text);

struct ClaimOutcome {
  std::string claim_id;
  std::string team_id;
  std::string player_id;
  ClaimStatus status = ClaimStatus::kFailed;
  std::string reason;
};

// Operation names stored in failed_transactions.operation.
enum class FailureOperation {
  kAdd,
  kDrop,
  kAddDrop,
  kAddDuplicate,
  kRosterFull,
  kNotOwned,
  kOnWaivers,
  kUnknown,
};

const char* ToString(FailureOperation op);

// Ledger entry kinds.
inline constexpr const char* kEntryAdd  = "ADD";
inline constexpr const char* kEntryDrop = "DROP";

// Failure reasons surfaced on claims.
inline constexpr const char* kReasonAlreadyRostered = "Player already rostered";
inline constexpr const char* kReasonRosterFull      = "Roster full";
inline constexpr const char* kReasonNoOwner         = "Team has no owner";

} // namespace roster::ledger
