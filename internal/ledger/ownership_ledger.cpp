#include "ownership_ledger.hpp"

namespace roster::ledger {

OwnershipLedger::OwnershipLedger(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

db::Result OwnershipLedger::Acquire(db::Transaction& tx, const std::string& league_id, const std::string& team_id, const std::string& player_id,
                                    uint64_t acquired_at_ms) {
  db::model::RosterAssignmentRecord record;
  record.league_id      = league_id;
  record.team_id        = team_id;
  record.player_id      = player_id;
  record.acquired_at_ms = acquired_at_ms;
  return repository_->InsertAssignment(tx, record);
}

db::Result OwnershipLedger::Release(db::Transaction& tx, const std::string& league_id, const std::string& team_id, const std::string& player_id) {
  return repository_->DeleteAssignment(tx, league_id, team_id, player_id);
}

std::optional<std::string> OwnershipLedger::OwnerOf(db::Transaction& tx, const std::string& league_id, const std::string& player_id) {
  auto assignment = repository_->GetAssignment(tx, league_id, player_id);
  if (!assignment) return std::nullopt;
  return assignment->team_id;
}

std::vector<std::string> OwnershipLedger::RosterOf(db::Transaction& tx, const std::string& league_id, const std::string& team_id) {
  std::vector<std::string> players;
  for (auto& assignment : repository_->ListAssignments(tx, league_id, team_id)) {
    players.push_back(std::move(assignment.player_id));
  }
  return players;
}

uint64_t OwnershipLedger::RosterSize(db::Transaction& tx, const std::string& league_id, const std::string& team_id) {
  return repository_->CountAssignments(tx, league_id, team_id);
}

} // namespace roster::ledger
