#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/claim_record.hpp"
#include "internal/db/model/draft_pick_record.hpp"
#include "internal/db/model/expiry_window_record.hpp"
#include "internal/db/model/failed_attempt_record.hpp"
#include "internal/db/model/league_record.hpp"
#include "internal/db/model/ledger_entry_record.hpp"
#include "internal/db/model/lineup_record.hpp"
#include "internal/db/model/priority_record.hpp"
#include "internal/db/model/roster_assignment_record.hpp"
#include "internal/db/model/team_record.hpp"

namespace roster::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - InsertAssignment reports ConstraintViolation when (league, player)
    already has an owner; exclusivity is never checked in application
    code alone
  - ResolveClaim only transitions pending claims (Conflict otherwise)
  - RotatePriorityToBack keeps ranks unique at every statement boundary

  The DB is the source of truth for:
    ownership
    claim lifecycle
    priority order
    cooldown windows
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions and locks
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Non-blocking. Returns nullptr when another holder owns the league.
  // Must not be called while the calling thread has a transaction open.
  virtual std::unique_ptr<LeagueLock> TryLockLeague(const std::string& league_id) = 0;

  // ---------------------------------------------------------------------
  // Leagues and teams (upstream data)
  // ---------------------------------------------------------------------

  virtual Result UpsertLeague(Transaction&, const model::LeagueRecord&) = 0;

  virtual std::optional<model::LeagueRecord> GetLeague(Transaction&, const std::string& league_id) = 0;

  virtual std::vector<model::LeagueRecord> ListLeagues(Transaction&) = 0;

  virtual Result UpsertTeam(Transaction&, const model::TeamRecord&) = 0;

  virtual std::optional<model::TeamRecord> GetTeam(Transaction&, const std::string& team_id) = 0;

  virtual std::optional<model::TeamRecord> FindTeamByOwner(Transaction&, const std::string& league_id, const std::string& user_id) = 0;

  // ---------------------------------------------------------------------
  // Ownership ledger
  // ---------------------------------------------------------------------

  virtual Result InsertAssignment(Transaction&, const model::RosterAssignmentRecord&) = 0;

  // NotFound unless the row exists and belongs to team_id.
  virtual Result DeleteAssignment(Transaction&, const std::string& league_id, const std::string& team_id, const std::string& player_id) = 0;

  virtual std::optional<model::RosterAssignmentRecord> GetAssignment(Transaction&, const std::string& league_id, const std::string& player_id) = 0;

  virtual std::vector<model::RosterAssignmentRecord> ListAssignments(Transaction&, const std::string& league_id, const std::string& team_id) = 0;

  virtual uint64_t CountAssignments(Transaction&, const std::string& league_id, const std::string& team_id) = 0;

  // Skip-locked ownership probe used by the claim processor.
  virtual OwnershipProbe ProbeOwnership(Transaction&, const std::string& league_id, const std::string& player_id) = 0;

  // ---------------------------------------------------------------------
  // Audit trail
  // ---------------------------------------------------------------------

  virtual Result AppendLedgerEntry(Transaction&, const model::LedgerEntryRecord&) = 0;

  virtual std::vector<model::LedgerEntryRecord> ListLedgerEntries(Transaction&, const std::string& league_id) = 0;

  virtual Result InsertFailedAttempt(Transaction&, const model::FailedAttemptRecord&) = 0;

  virtual std::vector<model::FailedAttemptRecord> ListFailedAttempts(Transaction&, const std::string& league_id) = 0;

  // ---------------------------------------------------------------------
  // Claims
  // ---------------------------------------------------------------------

  virtual Result InsertClaim(Transaction&, const model::ClaimRecord&) = 0;

  virtual std::optional<model::ClaimRecord> GetClaim(Transaction&, const std::string& claim_id) = 0;

  // Newest first.
  virtual std::vector<model::ClaimRecord> ListClaims(Transaction&, const ClaimFilter&) = 0;

  // Pending claims ordered by the team's current rank, then created_at.
  // Teams without a rank row fall back to the claim's priority snapshot.
  virtual std::vector<model::ClaimRecord> SelectPendingClaims(Transaction&, const std::string& league_id, ClaimOrder order, std::size_t limit) = 0;

  // Locks a claim row for processing. nullopt when the claim is no longer
  // pending or another processor holds it.
  virtual std::optional<model::ClaimRecord> LockPendingClaim(Transaction&, const std::string& claim_id) = 0;

  virtual Result ResolveClaim(Transaction&, const std::string& claim_id, const std::string& status, const std::string& reason, uint64_t processed_at_ms) = 0;

  virtual std::vector<std::string> ListLeaguesWithPendingClaims(Transaction&) = 0;

  virtual uint64_t CountPendingClaims(Transaction&, const std::string& league_id) = 0;

  // Latest processed_at_ms over successful and failed claims. Cancelled
  // claims do not count as a processing run.
  virtual std::optional<uint64_t> LastClaimProcessedAt(Transaction&, const std::string& league_id) = 0;

  // ---------------------------------------------------------------------
  // Priority rotation table
  // ---------------------------------------------------------------------

  virtual Result UpsertPriority(Transaction&, const model::PriorityRecord&) = 0;

  virtual std::optional<model::PriorityRecord> GetPriority(Transaction&, const std::string& league_id, const std::string& team_id) = 0;

  // Ascending rank.
  virtual std::vector<model::PriorityRecord> ListPriorities(Transaction&, const std::string& league_id) = 0;

  // Team moves to max(rank) + 1 of the league; every rank above the team's
  // old rank shifts down by one.
  virtual Result RotatePriorityToBack(Transaction&, const std::string& league_id, const std::string& team_id, uint64_t updated_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Expiry windows
  // ---------------------------------------------------------------------

  // Closes any previous open window for the same player first.
  virtual Result OpenExpiryWindow(Transaction&, const model::ExpiryWindowRecord&) = 0;

  virtual std::optional<model::ExpiryWindowRecord> GetLatestExpiryWindow(Transaction&, const std::string& league_id, const std::string& player_id) = 0;

  virtual Result CloseExpiryWindows(Transaction&, const std::string& league_id, const std::string& player_id, uint64_t cleared_at_ms) = 0;

  // Closes every open window released at or before released_before_ms.
  // Returns how many windows were closed.
  virtual uint64_t CloseLapsedExpiryWindows(Transaction&, const std::string& league_id, uint64_t released_before_ms, uint64_t cleared_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Lineup cache (best effort projection)
  // ---------------------------------------------------------------------

  // Row-locks the team's lineup. nullopt when the team has no lineup yet.
  virtual std::optional<model::LineupRecord> LockLineup(Transaction&, const std::string& league_id, const std::string& team_id) = 0;

  virtual Result RemoveFromLineup(Transaction&, const std::string& league_id, const std::string& team_id, const std::string& player_id, uint64_t updated_at_ms) = 0;

  // Creates the lineup row when missing.
  virtual Result AddToLineupBench(Transaction&, const std::string& league_id, const std::string& team_id, const std::string& player_id, uint64_t updated_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Legacy draft-pick mirror
  // ---------------------------------------------------------------------

  // Inserts or reactivates the mirror row.
  virtual Result UpsertDraftPick(Transaction&, const model::DraftPickRecord&) = 0;

  virtual Result SoftDeleteDraftPick(Transaction&, const std::string& league_id, const std::string& team_id, const std::string& player_id, uint64_t deleted_at_ms) = 0;

  virtual std::optional<model::DraftPickRecord> GetDraftPick(Transaction&, const std::string& league_id, const std::string& team_id, const std::string& player_id) = 0;

  virtual uint32_t NextDraftPickNumber(Transaction&, const std::string& league_id) = 0;
};

} // namespace roster::db
