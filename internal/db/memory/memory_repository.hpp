#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace roster::db::memory {

class MemoryTransaction;
class MemoryLeagueLock;

/*
  In-process backend.

  One writer at a time: a MemoryTransaction holds mutex_ from Begin()
  until Commit()/Rollback(), working on a copy of the committed state.
  That serializes movers the way BEGIN IMMEDIATE does for SQLite, so
  the uniqueness checks below are race free.
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<LeagueLock>  TryLockLeague(const std::string& league_id) override;

  Result                             UpsertLeague(Transaction&, const model::LeagueRecord&) override;
  std::optional<model::LeagueRecord> GetLeague(Transaction&, const std::string&) override;
  std::vector<model::LeagueRecord>   ListLeagues(Transaction&) override;
  Result                             UpsertTeam(Transaction&, const model::TeamRecord&) override;
  std::optional<model::TeamRecord>   GetTeam(Transaction&, const std::string&) override;
  std::optional<model::TeamRecord>   FindTeamByOwner(Transaction&, const std::string&, const std::string&) override;

  Result InsertAssignment(Transaction&, const model::RosterAssignmentRecord&) override;
  Result DeleteAssignment(Transaction&, const std::string&, const std::string&, const std::string&) override;
  std::optional<model::RosterAssignmentRecord> GetAssignment(Transaction&, const std::string&, const std::string&) override;
  std::vector<model::RosterAssignmentRecord>   ListAssignments(Transaction&, const std::string&, const std::string&) override;
  uint64_t                                     CountAssignments(Transaction&, const std::string&, const std::string&) override;
  OwnershipProbe                               ProbeOwnership(Transaction&, const std::string&, const std::string&) override;

  Result                                   AppendLedgerEntry(Transaction&, const model::LedgerEntryRecord&) override;
  std::vector<model::LedgerEntryRecord>    ListLedgerEntries(Transaction&, const std::string&) override;
  Result                                   InsertFailedAttempt(Transaction&, const model::FailedAttemptRecord&) override;
  std::vector<model::FailedAttemptRecord>  ListFailedAttempts(Transaction&, const std::string&) override;

  Result                            InsertClaim(Transaction&, const model::ClaimRecord&) override;
  std::optional<model::ClaimRecord> GetClaim(Transaction&, const std::string&) override;
  std::vector<model::ClaimRecord>   ListClaims(Transaction&, const ClaimFilter&) override;
  std::vector<model::ClaimRecord>   SelectPendingClaims(Transaction&, const std::string&, ClaimOrder, std::size_t) override;
  std::optional<model::ClaimRecord> LockPendingClaim(Transaction&, const std::string&) override;
  Result ResolveClaim(Transaction&, const std::string&, const std::string&, const std::string&, uint64_t) override;
  std::vector<std::string> ListLeaguesWithPendingClaims(Transaction&) override;
  uint64_t                 CountPendingClaims(Transaction&, const std::string&) override;
  std::optional<uint64_t>  LastClaimProcessedAt(Transaction&, const std::string&) override;

  Result                               UpsertPriority(Transaction&, const model::PriorityRecord&) override;
  std::optional<model::PriorityRecord> GetPriority(Transaction&, const std::string&, const std::string&) override;
  std::vector<model::PriorityRecord>   ListPriorities(Transaction&, const std::string&) override;
  Result RotatePriorityToBack(Transaction&, const std::string&, const std::string&, uint64_t) override;

  Result OpenExpiryWindow(Transaction&, const model::ExpiryWindowRecord&) override;
  std::optional<model::ExpiryWindowRecord> GetLatestExpiryWindow(Transaction&, const std::string&, const std::string&) override;
  Result   CloseExpiryWindows(Transaction&, const std::string&, const std::string&, uint64_t) override;
  uint64_t CloseLapsedExpiryWindows(Transaction&, const std::string&, uint64_t, uint64_t) override;

  std::optional<model::LineupRecord> LockLineup(Transaction&, const std::string&, const std::string&) override;
  Result RemoveFromLineup(Transaction&, const std::string&, const std::string&, const std::string&, uint64_t) override;
  Result AddToLineupBench(Transaction&, const std::string&, const std::string&, const std::string&, uint64_t) override;

  Result UpsertDraftPick(Transaction&, const model::DraftPickRecord&) override;
  Result SoftDeleteDraftPick(Transaction&, const std::string&, const std::string&, const std::string&, uint64_t) override;
  std::optional<model::DraftPickRecord> GetDraftPick(Transaction&, const std::string&, const std::string&, const std::string&) override;
  uint32_t NextDraftPickNumber(Transaction&, const std::string&) override;

 private:
  friend class MemoryTransaction;
  friend class MemoryLeagueLock;

  struct State {
    std::map<std::string, model::LeagueRecord> leagues;
    std::map<std::string, model::TeamRecord>   teams;

    // keyed by (league, player)
    std::map<std::string, model::RosterAssignmentRecord> assignments;

    std::vector<model::LedgerEntryRecord>   ledger;
    uint64_t                                next_entry_id = 1;
    std::vector<model::FailedAttemptRecord> failed_attempts;

    std::map<std::string, model::ClaimRecord> claims;

    // keyed by (league, team)
    std::map<std::string, model::PriorityRecord> priorities;

    std::vector<model::ExpiryWindowRecord> expiry_windows;

    // keyed by (league, team)
    std::map<std::string, model::LineupRecord> lineups;

    // keyed by (league, team, player)
    std::map<std::string, model::DraftPickRecord> draft_picks;
  };

  void ReleaseLeague(const std::string& league_id);

  std::mutex mutex_;
  State      committed_;

  std::mutex            locks_mutex_;
  std::set<std::string> locked_leagues_;
};

} // namespace roster::db::memory
