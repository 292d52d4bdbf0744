#include "types.hpp"

namespace roster::ledger {

const char* ToString(MoveStatus status) {
  switch (status) {
    case MoveStatus::kSuccess:
      return "success";
    case MoveStatus::kDuplicatePlayer:
      return "duplicate_player";
    case MoveStatus::kRosterFull:
      return "roster_full";
    case MoveStatus::kNotOwned:
      return "not_owned";
    case MoveStatus::kNoTeam:
      return "no_team";
    case MoveStatus::kError:
      return "error";
  }
  return "error";
}

const char* ToString(ClaimStatus status) {
  switch (status) {
    case ClaimStatus::kPending:
      return "pending";
    case ClaimStatus::kSuccessful:
      return "successful";
    case ClaimStatus::kFailed:
      return "failed";
    case ClaimStatus::kCancelled:
      return "cancelled";
  }
  return "failed";
}

std::optional<ClaimStatus> ParseClaimStatus(std::string_view text) {
  if (text == "pending") return ClaimStatus::kPending;
  if (text == "successful") return ClaimStatus::kSuccessful;
  if (text == "failed") return ClaimStatus::kFailed;
  if (text == "cancelled") return ClaimStatus::kCancelled;
  return std::nullopt;
}

const char* ToString(FailureOperation op) {
  switch (op) {
    case FailureOperation::kAdd:
      return "ADD";
    case FailureOperation::kDrop:
      return "DROP";
    case FailureOperation::kAddDrop:
      return "ADD_DROP";
    case FailureOperation::kAddDuplicate:
      return "ADD_DUPLICATE";
    case FailureOperation::kRosterFull:
      return "ROSTER_FULL";
    case FailureOperation::kNotOwned:
      return "NOT_OWNED";
    case FailureOperation::kOnWaivers:
      return "ON_WAIVERS";
    case FailureOperation::kUnknown:
      return "UNKNOWN";
  }
  return "UNKNOWN";
}

} // namespace roster::ledger
