#include "failure_sink.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"

namespace roster::ledger {

FailureSink::FailureSink(std::shared_ptr<db::Repository> repository, util::ClockFn clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

void FailureSink::Record(const FailedAttempt& attempt) {
  db::model::FailedAttemptRecord record;
  record.id              = util::NewId();
  record.league_id       = attempt.league_id;
  record.team_id         = attempt.team_id;
  record.user_id         = attempt.user_id;
  record.operation       = ToString(attempt.operation);
  record.player_id       = attempt.player_id;
  record.error_message   = attempt.error_message;
  record.error_detail    = attempt.error_detail;
  record.attempted_at_ms = clock_();

  try {
    auto tx  = repository_->Begin();
    auto res = repository_->InsertFailedAttempt(*tx, record);
    if (!res) {
      tx->Rollback();
      ROSTER_LOG_ERROR("failed to record rejected move", {observability::StringField("league_id", record.league_id),
                                                          observability::StringField("operation", record.operation),
                                                          observability::StringField("error", res.message)});
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    ROSTER_LOG_ERROR("failed to record rejected move", {observability::StringField("league_id", record.league_id),
                                                        observability::StringField("operation", record.operation),
                                                        observability::StringField("error", e.what())});
  }
}

} // namespace roster::ledger
