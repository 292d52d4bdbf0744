#include "memory_tx.hpp"

#include <stdexcept>

namespace roster::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.mutex_) {
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::Commit() {
  if (finished_) {
    throw std::logic_error("transaction already finished");
  }
  repo_.committed_ = std::move(working_);
  finished_        = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (finished_) return;
  working_  = {};
  finished_ = true;
  lock_.unlock();
}

MemoryLeagueLock::MemoryLeagueLock(MemoryRepository& repo, std::string league_id)
    : repo_(repo), league_id_(std::move(league_id)) {
}

MemoryLeagueLock::~MemoryLeagueLock() {
  repo_.ReleaseLeague(league_id_);
}

} // namespace roster::db::memory
