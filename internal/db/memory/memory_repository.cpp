#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace roster::db::memory {

namespace {

std::string Key(const std::string& a, const std::string& b) {
  return a + "#" + b;
}

std::string Key(const std::string& a, const std::string& b, const std::string& c) {
  return a + "#" + b + "#" + c;
}

void EraseValue(std::vector<std::string>& v, const std::string& value) {
  v.erase(std::remove(v.begin(), v.end(), value), v.end());
}

bool Contains(const std::vector<std::string>& v, const std::string& value) {
  return std::find(v.begin(), v.end(), value) != v.end();
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

std::unique_ptr<LeagueLock> MemoryRepository::TryLockLeague(const std::string& league_id) {
  std::lock_guard lock(locks_mutex_);
  if (!locked_leagues_.insert(league_id).second) return nullptr;
  return std::make_unique<MemoryLeagueLock>(*this, league_id);
}

void MemoryRepository::ReleaseLeague(const std::string& league_id) {
  std::lock_guard lock(locks_mutex_);
  locked_leagues_.erase(league_id);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Leagues / teams
// ------------------------------------------------------------------

Result MemoryRepository::UpsertLeague(Transaction& t, const model::LeagueRecord& r) {
  TX(t).Mutable().leagues[r.league_id] = r;
  return Result::Ok();
}

std::optional<model::LeagueRecord> MemoryRepository::GetLeague(Transaction& t, const std::string& league_id) {
  const auto& s  = TX(t).View();
  auto        it = s.leagues.find(league_id);
  if (it == s.leagues.end()) return std::nullopt;
  return it->second;
}

std::vector<model::LeagueRecord> MemoryRepository::ListLeagues(Transaction& t) {
  std::vector<model::LeagueRecord> out;
  for (const auto& [_, league] : TX(t).View().leagues) out.push_back(league);
  return out;
}

Result MemoryRepository::UpsertTeam(Transaction& t, const model::TeamRecord& r) {
  TX(t).Mutable().teams[r.team_id] = r;
  return Result::Ok();
}

std::optional<model::TeamRecord> MemoryRepository::GetTeam(Transaction& t, const std::string& team_id) {
  const auto& s  = TX(t).View();
  auto        it = s.teams.find(team_id);
  if (it == s.teams.end()) return std::nullopt;
  return it->second;
}

std::optional<model::TeamRecord> MemoryRepository::FindTeamByOwner(Transaction& t, const std::string& league_id, const std::string& user_id) {
  for (const auto& [_, team] : TX(t).View().teams) {
    if (team.league_id == league_id && team.owner_user_id && *team.owner_user_id == user_id) return team;
  }
  return std::nullopt;
}

// ------------------------------------------------------------------
// Ownership
// ------------------------------------------------------------------

Result MemoryRepository::InsertAssignment(Transaction& t, const model::RosterAssignmentRecord& r) {
  auto&      s   = TX(t).Mutable();
  const auto key = Key(r.league_id, r.player_id);
  if (s.assignments.contains(key)) {
    return Result::Err(ErrorCode::ConstraintViolation, "roster_assignments(league_id, player_id) is not unique");
  }
  s.assignments[key] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteAssignment(Transaction& t, const std::string& league_id, const std::string& team_id, const std::string& player_id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.assignments.find(Key(league_id, player_id));
  if (it == s.assignments.end() || it->second.team_id != team_id) return Result::Err(ErrorCode::NotFound);
  s.assignments.erase(it);
  return Result::Ok();
}

std::optional<model::RosterAssignmentRecord> MemoryRepository::GetAssignment(Transaction& t, const std::string& league_id, const std::string& player_id) {
  const auto& s  = TX(t).View();
  auto        it = s.assignments.find(Key(league_id, player_id));
  if (it == s.assignments.end()) return std::nullopt;
  return it->second;
}

std::vector<model::RosterAssignmentRecord> MemoryRepository::ListAssignments(Transaction& t, const std::string& league_id, const std::string& team_id) {
  std::vector<model::RosterAssignmentRecord> out;
  for (const auto& [_, a] : TX(t).View().assignments) {
    if (a.league_id == league_id && a.team_id == team_id) out.push_back(a);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.acquired_at_ms != b.acquired_at_ms ? a.acquired_at_ms < b.acquired_at_ms : a.player_id < b.player_id;
  });
  return out;
}

uint64_t MemoryRepository::CountAssignments(Transaction& t, const std::string& league_id, const std::string& team_id) {
  uint64_t n = 0;
  for (const auto& [_, a] : TX(t).View().assignments) {
    if (a.league_id == league_id && a.team_id == team_id) ++n;
  }
  return n;
}

OwnershipProbe MemoryRepository::ProbeOwnership(Transaction& t, const std::string& league_id, const std::string& player_id) {
  // The store lock is exclusive, so no row can be held by anyone else.
  return TX(t).View().assignments.contains(Key(league_id, player_id)) ? OwnershipProbe::kOwned : OwnershipProbe::kFree;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result MemoryRepository::AppendLedgerEntry(Transaction& t, const model::LedgerEntryRecord& r) {
  auto& s        = TX(t).Mutable();
  auto  entry    = r;
  entry.entry_id = s.next_entry_id++;
  s.ledger.push_back(std::move(entry));
  return Result::Ok();
}

std::vector<model::LedgerEntryRecord> MemoryRepository::ListLedgerEntries(Transaction& t, const std::string& league_id) {
  std::vector<model::LedgerEntryRecord> out;
  for (const auto& e : TX(t).View().ledger)
    if (e.league_id == league_id) out.push_back(e);
  return out;
}

Result MemoryRepository::InsertFailedAttempt(Transaction& t, const model::FailedAttemptRecord& r) {
  TX(t).Mutable().failed_attempts.push_back(r);
  return Result::Ok();
}

std::vector<model::FailedAttemptRecord> MemoryRepository::ListFailedAttempts(Transaction& t, const std::string& league_id) {
  std::vector<model::FailedAttemptRecord> out;
  for (const auto& f : TX(t).View().failed_attempts)
    if (f.league_id == league_id) out.push_back(f);
  return out;
}

// ------------------------------------------------------------------
// Claims
// ------------------------------------------------------------------

Result MemoryRepository::InsertClaim(Transaction& t, const model::ClaimRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.claims.contains(r.claim_id)) return Result::Err(ErrorCode::AlreadyExists);
  if (r.status == "pending") {
    for (const auto& [_, c] : s.claims) {
      if (c.status == "pending" && c.team_id == r.team_id && c.player_id == r.player_id) {
        return Result::Err(ErrorCode::AlreadyExists, "pending claim exists for team and player");
      }
    }
  }
  s.claims[r.claim_id] = r;
  return Result::Ok();
}

std::optional<model::ClaimRecord> MemoryRepository::GetClaim(Transaction& t, const std::string& claim_id) {
  const auto& s  = TX(t).View();
  auto        it = s.claims.find(claim_id);
  if (it == s.claims.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ClaimRecord> MemoryRepository::ListClaims(Transaction& t, const ClaimFilter& filter) {
  std::vector<model::ClaimRecord> out;
  for (const auto& [_, c] : TX(t).View().claims) {
    if (c.league_id != filter.league_id) continue;
    if (filter.team_id && c.team_id != *filter.team_id) continue;
    if (filter.status && c.status != *filter.status) continue;
    out.push_back(c);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms != b.created_at_ms ? a.created_at_ms > b.created_at_ms : a.claim_id > b.claim_id;
  });
  if (out.size() > filter.limit) out.resize(filter.limit);
  return out;
}

std::vector<model::ClaimRecord> MemoryRepository::SelectPendingClaims(Transaction& t, const std::string& league_id, ClaimOrder order, std::size_t limit) {
  const auto& s = TX(t).View();

  std::vector<std::pair<uint32_t, model::ClaimRecord>> ranked;
  for (const auto& [_, c] : s.claims) {
    if (c.league_id != league_id || c.status != "pending") continue;
    auto     p    = s.priorities.find(Key(league_id, c.team_id));
    uint32_t rank = p == s.priorities.end() ? c.priority_snapshot : p->second.rank;
    ranked.emplace_back(rank, c);
  }

  std::sort(ranked.begin(), ranked.end(), [order](const auto& a, const auto& b) {
    if (a.first != b.first) {
      return order == ClaimOrder::kRankAscending ? a.first < b.first : a.first > b.first;
    }
    if (a.second.created_at_ms != b.second.created_at_ms) return a.second.created_at_ms < b.second.created_at_ms;
    return a.second.claim_id < b.second.claim_id;
  });

  std::vector<model::ClaimRecord> out;
  for (auto& [_, c] : ranked) {
    if (out.size() >= limit) break;
    out.push_back(std::move(c));
  }
  return out;
}

std::optional<model::ClaimRecord> MemoryRepository::LockPendingClaim(Transaction& t, const std::string& claim_id) {
  auto c = GetClaim(t, claim_id);
  if (!c || c->status != "pending") return std::nullopt;
  return c;
}

Result MemoryRepository::ResolveClaim(Transaction& t, const std::string& claim_id, const std::string& status, const std::string& reason, uint64_t processed_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.claims.find(claim_id);
  if (it == s.claims.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.status != "pending") return Result::Err(ErrorCode::Conflict, "claim is " + it->second.status);

  it->second.status          = status;
  it->second.failure_reason  = reason;
  it->second.processed_at_ms = processed_at_ms;
  return Result::Ok();
}

std::vector<std::string> MemoryRepository::ListLeaguesWithPendingClaims(Transaction& t) {
  std::set<std::string> leagues;
  for (const auto& [_, c] : TX(t).View().claims)
    if (c.status == "pending") leagues.insert(c.league_id);
  return {leagues.begin(), leagues.end()};
}

uint64_t MemoryRepository::CountPendingClaims(Transaction& t, const std::string& league_id) {
  uint64_t n = 0;
  for (const auto& [_, c] : TX(t).View().claims)
    if (c.league_id == league_id && c.status == "pending") ++n;
  return n;
}

std::optional<uint64_t> MemoryRepository::LastClaimProcessedAt(Transaction& t, const std::string& league_id) {
  std::optional<uint64_t> last;
  for (const auto& [_, c] : TX(t).View().claims) {
    if (c.league_id != league_id || c.processed_at_ms == 0) continue;
    if (c.status != "successful" && c.status != "failed") continue;
    if (!last || c.processed_at_ms > *last) last = c.processed_at_ms;
  }
  return last;
}

// ------------------------------------------------------------------
// Priority
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPriority(Transaction& t, const model::PriorityRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& [_, p] : s.priorities) {
    if (p.league_id == r.league_id && p.team_id != r.team_id && p.rank == r.rank) {
      return Result::Err(ErrorCode::ConstraintViolation, "waiver_priority(league_id, priority) is not unique");
    }
  }
  s.priorities[Key(r.league_id, r.team_id)] = r;
  return Result::Ok();
}

std::optional<model::PriorityRecord> MemoryRepository::GetPriority(Transaction& t, const std::string& league_id, const std::string& team_id) {
  const auto& s  = TX(t).View();
  auto        it = s.priorities.find(Key(league_id, team_id));
  if (it == s.priorities.end()) return std::nullopt;
  return it->second;
}

std::vector<model::PriorityRecord> MemoryRepository::ListPriorities(Transaction& t, const std::string& league_id) {
  std::vector<model::PriorityRecord> out;
  for (const auto& [_, p] : TX(t).View().priorities)
    if (p.league_id == league_id) out.push_back(p);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.rank < b.rank; });
  return out;
}

Result MemoryRepository::RotatePriorityToBack(Transaction& t, const std::string& league_id, const std::string& team_id, uint64_t updated_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.priorities.find(Key(league_id, team_id));
  if (it == s.priorities.end()) return Result::Err(ErrorCode::NotFound, "team has no priority rank");

  const uint32_t old_rank = it->second.rank;
  uint32_t       max_rank = 0;
  for (auto& [key, p] : s.priorities) {
    if (p.league_id != league_id || p.team_id == team_id) continue;
    if (p.rank > old_rank) {
      --p.rank;
      p.updated_at_ms = updated_at_ms;
    }
    max_rank = std::max(max_rank, p.rank);
  }
  it->second.rank          = max_rank + 1;
  it->second.updated_at_ms = updated_at_ms;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Expiry windows
// ------------------------------------------------------------------

Result MemoryRepository::OpenExpiryWindow(Transaction& t, const model::ExpiryWindowRecord& r) {
  auto& s = TX(t).Mutable();
  for (auto& w : s.expiry_windows) {
    if (w.league_id == r.league_id && w.player_id == r.player_id && !w.cleared_at_ms) w.cleared_at_ms = r.released_at_ms;
  }
  s.expiry_windows.push_back(r);
  return Result::Ok();
}

std::optional<model::ExpiryWindowRecord> MemoryRepository::GetLatestExpiryWindow(Transaction& t, const std::string& league_id, const std::string& player_id) {
  std::optional<model::ExpiryWindowRecord> latest;
  for (const auto& w : TX(t).View().expiry_windows) {
    if (w.league_id != league_id || w.player_id != player_id) continue;
    if (!latest || w.released_at_ms >= latest->released_at_ms) latest = w;
  }
  return latest;
}

Result MemoryRepository::CloseExpiryWindows(Transaction& t, const std::string& league_id, const std::string& player_id, uint64_t cleared_at_ms) {
  for (auto& w : TX(t).Mutable().expiry_windows) {
    if (w.league_id == league_id && w.player_id == player_id && !w.cleared_at_ms) w.cleared_at_ms = cleared_at_ms;
  }
  return Result::Ok();
}

uint64_t MemoryRepository::CloseLapsedExpiryWindows(Transaction& t, const std::string& league_id, uint64_t released_before_ms, uint64_t cleared_at_ms) {
  uint64_t closed = 0;
  for (auto& w : TX(t).Mutable().expiry_windows) {
    if (w.league_id == league_id && !w.cleared_at_ms && w.released_at_ms <= released_before_ms) {
      w.cleared_at_ms = cleared_at_ms;
      ++closed;
    }
  }
  return closed;
}

// ------------------------------------------------------------------
// Lineup cache
// ------------------------------------------------------------------

std::optional<model::LineupRecord> MemoryRepository::LockLineup(Transaction& t, const std::string& league_id, const std::string& team_id) {
  const auto& s  = TX(t).View();
  auto        it = s.lineups.find(Key(league_id, team_id));
  if (it == s.lineups.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::RemoveFromLineup(Transaction& t, const std::string& league_id, const std::string& team_id, const std::string& player_id, uint64_t updated_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.lineups.find(Key(league_id, team_id));
  if (it == s.lineups.end()) return Result::Ok();

  EraseValue(it->second.active, player_id);
  EraseValue(it->second.bench, player_id);
  EraseValue(it->second.injured_reserve, player_id);
  it->second.updated_at_ms = updated_at_ms;
  return Result::Ok();
}

Result MemoryRepository::AddToLineupBench(Transaction& t, const std::string& league_id, const std::string& team_id, const std::string& player_id, uint64_t updated_at_ms) {
  auto& s      = TX(t).Mutable();
  auto& lineup = s.lineups[Key(league_id, team_id)];
  if (lineup.team_id.empty()) {
    lineup.league_id = league_id;
    lineup.team_id   = team_id;
  }
  if (!Contains(lineup.active, player_id) && !Contains(lineup.bench, player_id) && !Contains(lineup.injured_reserve, player_id)) {
    lineup.bench.push_back(player_id);
  }
  lineup.updated_at_ms = updated_at_ms;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Draft-pick mirror
// ------------------------------------------------------------------

Result MemoryRepository::UpsertDraftPick(Transaction& t, const model::DraftPickRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.draft_picks.find(Key(r.league_id, r.team_id, r.player_id));
  if (it == s.draft_picks.end()) {
    s.draft_picks[Key(r.league_id, r.team_id, r.player_id)] = r;
    return Result::Ok();
  }
  it->second.deleted_at_ms = std::nullopt;
  it->second.picked_at_ms  = r.picked_at_ms;
  return Result::Ok();
}

Result MemoryRepository::SoftDeleteDraftPick(Transaction& t, const std::string& league_id, const std::string& team_id, const std::string& player_id, uint64_t deleted_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.draft_picks.find(Key(league_id, team_id, player_id));
  if (it != s.draft_picks.end() && !it->second.deleted_at_ms) it->second.deleted_at_ms = deleted_at_ms;
  return Result::Ok();
}

std::optional<model::DraftPickRecord> MemoryRepository::GetDraftPick(Transaction& t, const std::string& league_id, const std::string& team_id, const std::string& player_id) {
  const auto& s  = TX(t).View();
  auto        it = s.draft_picks.find(Key(league_id, team_id, player_id));
  if (it == s.draft_picks.end()) return std::nullopt;
  return it->second;
}

uint32_t MemoryRepository::NextDraftPickNumber(Transaction& t, const std::string& league_id) {
  uint32_t max_pick = 0;
  for (const auto& [_, p] : TX(t).View().draft_picks)
    if (p.league_id == league_id) max_pick = std::max(max_pick, p.pick_number);
  return max_pick + 1;
}

} // namespace roster::db::memory
