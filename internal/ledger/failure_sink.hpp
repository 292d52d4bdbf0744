#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/ledger/types.hpp"
#include "internal/util/time.hpp"

namespace roster::ledger {

struct FailedAttempt {
  std::string      league_id;
  std::string      team_id;
  std::string      user_id;
  FailureOperation operation = FailureOperation::kUnknown;
  std::string      player_id;
  std::string      error_message;
  std::string      error_detail;
};

/*
  Write-only record of rejected mutations.

  Record() opens its own transaction, so it must only be called after the
  caller's transaction has been rolled back. A failure to record is logged
  and does not change the caller's result.
*/
class FailureSink {
 public:
  FailureSink(std::shared_ptr<db::Repository> repository, util::ClockFn clock);

  void Record(const FailedAttempt& attempt);

 private:
  std::shared_ptr<db::Repository> repository_;
  util::ClockFn                   clock_;
};

} // namespace roster::ledger
