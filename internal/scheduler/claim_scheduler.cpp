#include "claim_scheduler.hpp"

#include <exception>

#include "internal/ledger/claim_processor.hpp"
#include "internal/observability/logging.hpp"

namespace roster::scheduler {

ClaimScheduler::ClaimScheduler(std::shared_ptr<roster::ledger::ClaimProcessor> processor, ClaimSchedulerOptions options)
    : processor_(std::move(processor)), options_(options) {
  if (options_.poll_interval.count() <= 0) options_.poll_interval = std::chrono::seconds(60);
}

ClaimScheduler::~ClaimScheduler() {
  Stop();
}

void ClaimScheduler::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&ClaimScheduler::Run, this);
  ROSTER_LOG_INFO("claim scheduler started", {observability::IntField("poll_interval_sec", options_.poll_interval.count())});
}

void ClaimScheduler::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.exchange(false)) return;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  ROSTER_LOG_INFO("claim scheduler stopped");
}

std::size_t ClaimScheduler::RunOnce() {
  std::size_t ran = 0;
  for (const auto& league_id : processor_->DueLeagues()) {
    const auto outcomes = processor_->ProcessClaims(league_id, options_.batch_size);
    ROSTER_LOG_INFO("scheduled claim run",
                    {observability::StringField("league_id", league_id), observability::IntField("claims", static_cast<int64_t>(outcomes.size()))});
    ++ran;
  }
  processor_->SweepExpiredWindows();
  return ran;
}

void ClaimScheduler::Run() {
  while (running_) {
    try {
      RunOnce();
    } catch (const std::exception& e) {
      ROSTER_LOG_ERROR("scheduled claim poll failed", {observability::StringField("error", e.what())});
    }

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, options_.poll_interval, [this] { return !running_; });
  }
}

} // namespace roster::scheduler
