#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace roster::db {

// Result of probing a (league, player) ownership row under skip-locked
// semantics. Contended means another transaction holds the row lock.
enum class OwnershipProbe {
  kFree,
  kOwned,
  kContended,
};

// Batch ordering of pending claims by current priority rank.
enum class ClaimOrder {
  kRankAscending,
  kRankDescending,
};

struct ClaimFilter {
  std::string                league_id;
  std::optional<std::string> team_id;
  std::optional<std::string> status;
  std::size_t                limit = 100;
};

} // namespace roster::db
