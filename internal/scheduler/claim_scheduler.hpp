#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

namespace roster::ledger {
class ClaimProcessor;
}

namespace roster::scheduler {

struct ClaimSchedulerOptions {
  std::chrono::seconds poll_interval{60};
  std::size_t          batch_size = 100;
};

/*
  Background worker that triggers the daily claim runs.

  Every poll it processes the leagues that are due and then sweeps lapsed
  waiver windows. Runs are safe to overlap with manual ProcessClaims calls;
  the league lock turns the loser into a no-op.
*/
class ClaimScheduler {
 public:
  ClaimScheduler(std::shared_ptr<roster::ledger::ClaimProcessor> processor, ClaimSchedulerOptions options);
  ~ClaimScheduler();

  void Start();
  void Stop();

  // One poll, on the calling thread. Returns the number of leagues run.
  std::size_t RunOnce();

 private:
  void Run();

  std::shared_ptr<roster::ledger::ClaimProcessor> processor_;
  ClaimSchedulerOptions                           options_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              mutex_;
  std::condition_variable cv_;
};

} // namespace roster::scheduler
