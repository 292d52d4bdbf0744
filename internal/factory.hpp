#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/ledger/league_settings.hpp"
#include "internal/scheduler/claim_scheduler.hpp"

namespace roster::factory {

/*
  Application

  Owns every long-lived component of the server. The scheduler is built
  but not started; main decides when background processing begins.
*/
struct Application {
  std::shared_ptr<db::Repository>                repository;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
  std::shared_ptr<scheduler::ClaimScheduler>     scheduler;
};

/*
  Composition root. The only place that knows the concrete repository
  types; the backend is chosen by the database oneof in the config.
*/
Application Build(const roster::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const roster::runtime::config::RuntimeConfig& config);

ledger::LeagueDefaults ToLeagueDefaults(const roster::runtime::config::LeagueDefaults& config);

} // namespace roster::factory
