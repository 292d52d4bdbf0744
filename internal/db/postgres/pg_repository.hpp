#pragma once

#include <cstdint>
#include <exception>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace roster::db::postgres {

/*
  Postgres backend.

  League locks are transaction-scoped advisory locks held on a
  dedicated pooled connection for the lifetime of the handle.
  Claim rows and ownership probes use FOR UPDATE SKIP LOCKED so two
  processors never block on each other.
*/
class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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

  Result                                  AppendLedgerEntry(Transaction&, const model::LedgerEntryRecord&) override;
  std::vector<model::LedgerEntryRecord>   ListLedgerEntries(Transaction&, const std::string&) override;
  Result                                  InsertFailedAttempt(Transaction&, const model::FailedAttemptRecord&) override;
  std::vector<model::FailedAttemptRecord> ListFailedAttempts(Transaction&, const std::string&) override;

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception&);
};

} // namespace roster::db::postgres
