#pragma once

#include <cstdint>
#include <string>

namespace roster::db::model {

struct FailedAttemptRecord {
  std::string id;
  std::string league_id;
  std::string team_id; // empty when the team could not be resolved
  std::string user_id;
  std::string operation;
  std::string player_id;
  std::string error_message;
  std::string error_detail;
  uint64_t    attempted_at_ms = 0;
};

} // namespace roster::db::model
