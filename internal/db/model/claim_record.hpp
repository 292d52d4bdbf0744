#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace roster::db::model {

/*
  Contested acquisition request.

  status is one of "pending", "successful", "failed", "cancelled".
  Only pending rows transition; the store enforces that through
  ResolveClaim's conditional update.
*/

struct ClaimRecord {
  std::string                claim_id;
  std::string                league_id;
  std::string                team_id;
  std::string                player_id;
  std::optional<std::string> release_player_id;
  uint32_t                   priority_snapshot = 0;
  std::string                status            = "pending";
  uint64_t                   created_at_ms     = 0;
  uint64_t                   processed_at_ms   = 0; // 0 = not processed
  std::string                failure_reason;
};

} // namespace roster::db::model
