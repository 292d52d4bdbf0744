#include "priority_policy.hpp"

#include "internal/util/errors.hpp"

namespace roster::ledger {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

PriorityPolicy ParsePriorityPolicy(std::string_view name) {
  if (name.empty() || name == "rotating") return RotatingPolicy{};
  if (name == "reverse_standings") return ReverseStandingsPolicy{};
  if (name == "budget_bid") return BudgetBidPolicy{};
  throw util::InvalidArgument("unknown priority policy: " + std::string(name));
}

std::string PolicyName(const PriorityPolicy& policy) {
  return std::visit(Overloaded{
                        [](const RotatingPolicy&) { return std::string("rotating"); },
                        [](const ReverseStandingsPolicy&) { return std::string("reverse_standings"); },
                        [](const BudgetBidPolicy&) { return std::string("budget_bid"); },
                    },
                    policy);
}

std::optional<db::ClaimOrder> ClaimOrderFor(const PriorityPolicy& policy) {
  return std::visit(Overloaded{
                        [](const RotatingPolicy&) -> std::optional<db::ClaimOrder> { return db::ClaimOrder::kRankAscending; },
                        [](const ReverseStandingsPolicy&) -> std::optional<db::ClaimOrder> { return db::ClaimOrder::kRankDescending; },
                        [](const BudgetBidPolicy&) -> std::optional<db::ClaimOrder> { return std::nullopt; },
                    },
                    policy);
}

bool RotatesOnSuccess(const PriorityPolicy& policy) {
  return std::holds_alternative<RotatingPolicy>(policy);
}

} // namespace roster::ledger
