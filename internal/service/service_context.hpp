#pragma once

#include <memory>

#include "internal/ledger/league_settings.hpp"

namespace roster::db {
class Repository;
}
namespace roster::ledger {
class MoveExecutor;
class ClaimBook;
class ClaimProcessor;
} // namespace roster::ledger

namespace roster::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<roster::db::Repository>         repository;
  std::shared_ptr<roster::ledger::MoveExecutor>   executor;
  std::shared_ptr<roster::ledger::ClaimBook>      claims;
  std::shared_ptr<roster::ledger::ClaimProcessor> processor;
  roster::ledger::LeagueDefaults                  league_defaults;
};

} // namespace roster::service
