#include "admin_service.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/db/api/repository.hpp"
#include "internal/ledger/claim_processor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/proto_mapping.hpp"
#include "internal/service/rpc_observer.hpp"
#include "internal/util/errors.hpp"

namespace roster::service {

using namespace roster::ledger::v1;

namespace {

void ThrowIfDbError(const roster::db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  const auto message = prefix + ": " + result.message;
  switch (result.code) {
    case roster::db::ErrorCode::NotFound:
      throw roster::util::NotFound(message);
    case roster::db::ErrorCode::AlreadyExists:
    case roster::db::ErrorCode::ConstraintViolation:
      throw roster::util::AlreadyExists(message);
    default:
      throw std::runtime_error(message);
  }
}

LeagueSettings ToProto(const roster::ledger::LeagueSettings& settings, const std::string& name) {
  LeagueSettings out;
  out.set_league_id(settings.league_id);
  out.set_name(name);
  out.set_max_roster_size(settings.max_roster_size);
  out.set_cooldown_hours(settings.cooldown_hours);
  out.set_priority_policy(roster::service::ToProto(settings.policy));
  out.set_processing_time_utc(roster::util::FormatTimeOfDay(settings.processing_minute_utc));
  return out;
}

} // namespace

AdminService::AdminService(ServiceContext ctx, roster::util::ClockFn clock) : ctx_(std::move(ctx)), clock_(std::move(clock)) {
}

UpsertLeagueResponse AdminService::UpsertLeague(const UpsertLeagueRequest& req) {
  return ObserveRpc("RosterAdminService.UpsertLeague", [&] {
    const auto& in = req.settings();
    if (in.league_id().empty()) {
      throw roster::util::InvalidArgument("league_id is required");
    }

    const auto& defaults = ctx_.league_defaults;

    roster::ledger::LeagueSettings settings;
    settings.league_id             = in.league_id();
    settings.max_roster_size       = in.max_roster_size() == 0 ? defaults.max_roster_size : in.max_roster_size();
    settings.cooldown_hours        = in.cooldown_hours() == 0 ? defaults.cooldown_hours : in.cooldown_hours();
    settings.policy                = FromProto(in.priority_policy()).value_or(defaults.policy);
    settings.processing_minute_utc = defaults.processing_minute_utc;
    if (!in.processing_time_utc().empty()) {
      try {
        settings.processing_minute_utc = roster::util::ParseTimeOfDay(in.processing_time_utc());
      } catch (const std::invalid_argument& ex) {
        throw roster::util::InvalidArgument(ex.what());
      }
    }

    auto tx       = ctx_.repository->Begin();
    auto existing = ctx_.repository->GetLeague(*tx, settings.league_id);

    const auto name       = in.name().empty() && existing ? existing->name : in.name();
    const auto created_at = existing ? existing->created_at_ms : clock_();

    ThrowIfDbError(ctx_.repository->UpsertLeague(*tx, roster::ledger::ToRecord(settings, name, created_at)), "upsert league");
    tx->Commit();

    ROSTER_LOG_INFO("League settings stored", {roster::observability::StringField("league_id", settings.league_id),
                                               roster::observability::StringField("policy", roster::ledger::PolicyName(settings.policy))});

    UpsertLeagueResponse resp;
    *resp.mutable_settings() = ToProto(settings, name);
    return resp;
  });
}

UpsertTeamResponse AdminService::UpsertTeam(const UpsertTeamRequest& req) {
  return ObserveRpc("RosterAdminService.UpsertTeam", [&] {
    if (req.team_id().empty() || req.league_id().empty()) {
      throw roster::util::InvalidArgument("team_id and league_id are required");
    }

    const auto now = clock_();
    auto       tx  = ctx_.repository->Begin();
    if (!ctx_.repository->GetLeague(*tx, req.league_id())) {
      throw roster::util::NotFound("league not found: " + req.league_id());
    }

    auto existing = ctx_.repository->GetTeam(*tx, req.team_id());
    if (existing && existing->league_id != req.league_id()) {
      throw roster::util::InvalidArgument("team " + req.team_id() + " belongs to league " + existing->league_id);
    }

    roster::db::model::TeamRecord team;
    team.team_id   = req.team_id();
    team.league_id = req.league_id();
    if (!req.owner_user_id().empty()) team.owner_user_id = req.owner_user_id();
    team.name          = req.name();
    team.created_at_ms = existing ? existing->created_at_ms : now;
    ThrowIfDbError(ctx_.repository->UpsertTeam(*tx, team), "upsert team");

    uint32_t rank    = req.priority_rank();
    auto     current = ctx_.repository->GetPriority(*tx, req.league_id(), req.team_id());
    if (rank == 0 && current) {
      rank = current->rank;
    } else {
      if (rank == 0) {
        const auto entries = ctx_.repository->ListPriorities(*tx, req.league_id());
        for (const auto& entry : entries) rank = std::max(rank, entry.rank);
        ++rank;
      }
      roster::db::model::PriorityRecord priority;
      priority.league_id     = req.league_id();
      priority.team_id       = req.team_id();
      priority.rank          = rank;
      priority.updated_at_ms = now;
      ThrowIfDbError(ctx_.repository->UpsertPriority(*tx, priority), "upsert priority");
    }
    tx->Commit();

    UpsertTeamResponse resp;
    resp.set_team_id(team.team_id);
    resp.set_priority_rank(rank);
    return resp;
  });
}

GetProcessingStatusResponse AdminService::GetProcessingStatus(const GetProcessingStatusRequest& req) {
  return ObserveRpc("RosterAdminService.GetProcessingStatus", [&] {
    GetProcessingStatusResponse resp;
    for (const auto& status : ctx_.processor->ProcessingStatus(req.league_id())) *resp.add_leagues() = roster::service::ToProto(status);
    return resp;
  });
}

} // namespace roster::service
