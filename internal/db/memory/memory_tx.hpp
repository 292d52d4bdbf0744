#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace roster::db::memory {

/*
  Transaction = exclusive store lock + working copy
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return finished_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> lock_;
  MemoryRepository::State      working_;
  bool                         finished_ = false;
};

class MemoryLeagueLock final : public db::LeagueLock {
 public:
  MemoryLeagueLock(MemoryRepository& repo, std::string league_id);
  ~MemoryLeagueLock() override;

 private:
  MemoryRepository& repo_;
  std::string       league_id_;
};

} // namespace roster::db::memory
