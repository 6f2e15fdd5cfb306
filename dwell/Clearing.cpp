#include <dwell/Clearing.hpp>
#include <dwell/debug.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace dwell {

std::string to_string(ClearingPolicy policy) {
    switch (policy) {
        case ClearingPolicy::IncomeDescending: return "INCOME_DESCENDING";
        case ClearingPolicy::IncomeAscending:  return "INCOME_ASCENDING";
        case ClearingPolicy::Random:           return "RANDOM";
    }
    throw std::invalid_argument("Invalid clearing policy value " + std::to_string(static_cast<int>(policy)));
}

std::ostream& operator<<(std::ostream &os, ClearingPolicy policy) {
    return os << to_string(policy);
}

std::vector<Agent*> order(std::vector<Agent> &agents, ClearingPolicy policy, random::rng_t &rng) {
    std::vector<Agent*> ordered;
    ordered.reserve(agents.size());
    for (auto &a : agents) ordered.push_back(&a);

    switch (policy) {
        case ClearingPolicy::IncomeDescending:
            std::stable_sort(ordered.begin(), ordered.end(),
                    [](const Agent *a, const Agent *b) { return a->annualIncome() > b->annualIncome(); });
            return ordered;
        case ClearingPolicy::IncomeAscending:
            std::stable_sort(ordered.begin(), ordered.end(),
                    [](const Agent *a, const Agent *b) { return a->annualIncome() < b->annualIncome(); });
            return ordered;
        case ClearingPolicy::Random:
            // Fisher-Yates with boost's distribution, which (unlike std::shuffle) yields the same
            // permutation on every platform for a given engine state
            for (size_t i = ordered.size(); i > 1; i--) {
                boost::random::uniform_int_distribution<size_t> pick(0, i - 1);
                std::swap(ordered[i - 1], ordered[pick(rng)]);
            }
            return ordered;
    }
    throw std::invalid_argument("Invalid clearing policy value " + std::to_string(static_cast<int>(policy)));
}

ClearingPass::ClearingPass(Inventory &inventory, year_t reference_year)
    : inventory_(inventory), reference_year_{reference_year} {}

boost::optional<Purchase> ClearingPass::offer(Agent &agent) {
    result_.offered++;
    if (not agent.attemptPurchase(inventory_, reference_year_)) {
        if (not agent.housed()) result_.unhoused++;
        return boost::none;
    }

    const Property &bought = *agent.property();
    Purchase purchase{agent.id(), bought.id(), bought.price()};
    result_.purchases.push_back(purchase);
    return purchase;
}

const ClearingResult& ClearingPass::run(const std::vector<Agent*> &ordered) {
    for (Agent *agent : ordered) offer(*agent);
    return result_;
}

ClearingResult clear(std::vector<Agent> &agents, Inventory &inventory, ClearingPolicy policy,
        random::rng_t &rng, year_t reference_year) {
    auto ordered = order(agents, policy, rng);
    ClearingPass pass(inventory, reference_year);
    ClearingResult result = pass.run(ordered);
    DWELL_DBG("Cleared market with policy " << policy << ": " << result.purchases.size() << " purchases, "
            << result.unhoused << " agents unhoused, " << inventory.countAvailable() << " properties unsold");
    return result;
}

}
