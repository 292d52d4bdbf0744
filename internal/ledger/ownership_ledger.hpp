#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace roster::ledger {

/*
  Ownership ledger: (league, player) -> owning team.

  Exclusivity is the store's UNIQUE(league_id, player_id); Acquire never
  checks first and relies on the insert failing with ConstraintViolation.
  There is no transfer primitive: a reassignment is Release then Acquire
  in one transaction.
*/
class OwnershipLedger {
 public:
  explicit OwnershipLedger(std::shared_ptr<db::Repository> repository);

  // ConstraintViolation when the player already has an owner.
  db::Result Acquire(db::Transaction& tx, const std::string& league_id, const std::string& team_id, const std::string& player_id,
                     uint64_t acquired_at_ms);

  // NotFound when team_id does not own the player.
  db::Result Release(db::Transaction& tx, const std::string& league_id, const std::string& team_id, const std::string& player_id);

  std::optional<std::string> OwnerOf(db::Transaction& tx, const std::string& league_id, const std::string& player_id);
  std::vector<std::string>   RosterOf(db::Transaction& tx, const std::string& league_id, const std::string& team_id);
  uint64_t                   RosterSize(db::Transaction& tx, const std::string& league_id, const std::string& team_id);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace roster::ledger
