#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "internal/db/api/types.hpp"

namespace roster::ledger {

/*
  Claim ordering policy.

  Rotating:         lowest rank first; a successful team moves to the back.
  ReverseStandings: highest rank first (ranks mirror standings); ranks never
                    change on claim outcomes.
  BudgetBid:        sealed-bid allocation. Not supported; a run under this
                    policy processes nothing.
*/

struct RotatingPolicy {};
struct ReverseStandingsPolicy {};
struct BudgetBidPolicy {};

using PriorityPolicy = std::variant<RotatingPolicy, ReverseStandingsPolicy, BudgetBidPolicy>;

// "rotating", "reverse_standings", "budget_bid". Throws util::InvalidArgument.
PriorityPolicy ParsePriorityPolicy(std::string_view name);

std::string PolicyName(const PriorityPolicy& policy);

// nullopt when the policy cannot order claims.
std::optional<db::ClaimOrder> ClaimOrderFor(const PriorityPolicy& policy);

bool RotatesOnSuccess(const PriorityPolicy& policy);

} // namespace roster::ledger
