#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"

namespace roster::ledger {

/*
  Keeps the lineup display cache and the legacy draft-pick mirror in step
  with ledger writes, inside the ledger's transaction.

  Every write here is best effort: failures are logged and never fail
  the move that triggered them.
*/
class LineupProjection {
 public:
  explicit LineupProjection(std::shared_ptr<db::Repository> repository);

  void OnRelease(db::Transaction& tx, const std::string& league_id, const std::string& team_id, const std::string& player_id, uint64_t now_ms);
  void OnAcquire(db::Transaction& tx, const std::string& league_id, const std::string& team_id, const std::string& player_id, uint64_t now_ms);

  // Round number given to mirror rows created outside the draft.
  static constexpr uint32_t kFreeAgentRound = 999;

 private:
  void Warn(const char* step, const std::string& league_id, const std::string& team_id, const std::string& player_id, const std::string& error);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace roster::ledger
