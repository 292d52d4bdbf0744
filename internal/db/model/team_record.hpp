#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace roster::db::model {

struct TeamRecord {
  std::string                team_id;
  std::string                league_id;
  std::optional<std::string> owner_user_id; // unowned teams cannot win claims
  std::string                name;
  uint64_t                   created_at_ms = 0;
};

} // namespace roster::db::model
