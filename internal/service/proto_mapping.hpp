#pragma once

#include "api/roster/ledger/v1.hpp"
#include "internal/db/model/claim_record.hpp"
#include "internal/db/model/ledger_entry_record.hpp"
#include "internal/ledger/claim_book.hpp"
#include "internal/ledger/claim_processor.hpp"
#include "internal/ledger/priority_policy.hpp"
#include "internal/ledger/types.hpp"

namespace roster::service {

roster::ledger::v1::MoveStatus  ToProto(roster::ledger::MoveStatus status);
roster::ledger::v1::ClaimStatus ToProto(roster::ledger::ClaimStatus status);

roster::ledger::v1::MoveResult         ToProto(const roster::ledger::MoveResult& result);
roster::ledger::v1::Claim              ToProto(const roster::db::model::ClaimRecord& claim);
roster::ledger::v1::ClaimOutcome       ToProto(const roster::ledger::ClaimOutcome& outcome);
roster::ledger::v1::LedgerEntry        ToProto(const roster::db::model::LedgerEntryRecord& entry);
roster::ledger::v1::PlayerAvailability ToProto(const roster::ledger::Availability& availability);

roster::ledger::v1::LeagueProcessingStatus ToProto(const roster::ledger::LeagueProcessingStatus& status);
roster::ledger::v1::LeagueRunSummary       ToProto(const roster::ledger::LeagueRun& run);

roster::ledger::MoveRequest FromProto(const roster::ledger::v1::Move& move);

// UNSPECIFIED maps to nullopt.
std::optional<roster::ledger::PriorityPolicy> FromProto(roster::ledger::v1::PriorityPolicy policy);
roster::ledger::v1::PriorityPolicy            ToProto(const roster::ledger::PriorityPolicy& policy);

} // namespace roster::service
