#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace roster::db::model {

// Legacy mirror of ownership kept for older readers. Soft deleted.
struct DraftPickRecord {
  std::string             league_id;
  std::string             team_id;
  std::string             player_id;
  uint32_t                round_number = 0;
  uint32_t                pick_number  = 0;
  uint64_t                picked_at_ms = 0;
  std::optional<uint64_t> deleted_at_ms;
};

} // namespace roster::db::model
