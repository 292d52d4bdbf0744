#include "pg_pool.hpp"

#include <exception>

namespace roster::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

// Statements on the claim and move hot paths.
void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_assignment", "INSERT INTO roster_assignments(league_id,team_id,player_id,acquired_at_ms) VALUES($1,$2,$3,$4)");

  conn.prepare("delete_assignment", "DELETE FROM roster_assignments WHERE league_id=$1 AND team_id=$2 AND player_id=$3");

  conn.prepare("count_assignments", "SELECT COUNT(*) FROM roster_assignments WHERE league_id=$1 AND team_id=$2");

  conn.prepare("probe_assignment_skip_locked",
               "SELECT 1 FROM roster_assignments WHERE league_id=$1 AND player_id=$2 FOR UPDATE SKIP LOCKED");

  conn.prepare("probe_assignment", "SELECT 1 FROM roster_assignments WHERE league_id=$1 AND player_id=$2");

  conn.prepare("append_ledger_entry",
               "INSERT INTO transaction_ledger(league_id,team_id,user_id,kind,player_id,source,created_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7)");

  conn.prepare("lock_pending_claim",
               "SELECT claim_id,league_id,team_id,player_id,release_player_id,priority_snapshot,status,created_at_ms,processed_at_ms,failure_reason "
               "FROM waiver_claims WHERE claim_id=$1 AND status='pending' FOR UPDATE SKIP LOCKED");

  conn.prepare("resolve_claim",
               "UPDATE waiver_claims SET status=$2,failure_reason=$3,processed_at_ms=$4 WHERE claim_id=$1 AND status='pending'");

  conn.prepare("close_expiry_windows",
               "UPDATE player_waiver_status SET cleared_at_ms=$3 WHERE league_id=$1 AND player_id=$2 AND cleared_at_ms IS NULL");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      // Broken connections are dropped; the slot is reopened lazily.
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace roster::db::postgres
