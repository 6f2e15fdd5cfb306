#pragma once
#include <dwell/types.hpp>
#include <dwell/Agent.hpp>
#include <dwell/Inventory.hpp>
#include <dwell/noncopyable.hpp>
#include <dwell/random/rng.hpp>
#include <boost/optional.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace dwell {

/** The order in which agents are offered the market during clearing.  The order decides who gets
 * scarce properties first.
 */
enum class ClearingPolicy {
    /// Richest agents first
    IncomeDescending,
    /// Poorest agents first
    IncomeAscending,
    /// A uniformly random permutation, drawn from the simulation's random engine
    Random
};

/// Returns "INCOME_DESCENDING", "INCOME_ASCENDING" or "RANDOM"
std::string to_string(ClearingPolicy policy);
/// Writes the policy name to the stream
std::ostream& operator<<(std::ostream &os, ClearingPolicy policy);

/** A completed purchase. */
struct Purchase {
    id_t agent;
    id_t property;
    double price;
};

/** The result of one clearing pass. */
struct ClearingResult {
    /// Purchases, in the order they happened
    std::vector<Purchase> purchases;
    /// The number of agents offered the market
    size_t offered = 0;
    /// The number of offered agents that end the pass without a property
    size_t unhoused = 0;
};

/** Returns pointers to the given agents in the order prescribed by `policy`.
 *
 * Income orders are stable: agents with equal incomes keep their relative order from `agents`.
 * The Random policy applies a Fisher-Yates shuffle driven by `rng`, so the same engine state
 * always produces the same order.
 */
std::vector<Agent*> order(std::vector<Agent> &agents, ClearingPolicy policy, random::rng_t &rng);

/** A single market-clearing pass over one inventory.
 *
 * A ClearingPass is the only writer of its inventory while it exists: agents are offered the
 * market one at a time, and each offer observes every purchase made by earlier offers.  The pass
 * accumulates its ClearingResult as it goes; result() may be read at any point.
 *
 * Typical use, for agents already in clearing order:
 *
 *     ClearingPass pass(inventory);
 *     for (Agent *a : ordered) pass.offer(*a);
 *     auto result = pass.result();
 */
class ClearingPass final : private noncopyable {
public:
    /** Starts a pass over `inventory`, which must outlive the pass.
     *
     * \param inventory the market being cleared
     * \param reference_year the year used for the new-construction test of FANCY agents
     */
    explicit ClearingPass(Inventory &inventory, year_t reference_year = default_reference_year);

    /** Offers the market to one agent, who buys at most one property.
     *
     * \returns the purchase, if the agent bought something
     */
    boost::optional<Purchase> offer(Agent &agent);

    /** Offers the market to every agent in `ordered`, in sequence, and returns the result. */
    const ClearingResult& run(const std::vector<Agent*> &ordered);

    /// The accumulated result of the offers made so far
    const ClearingResult& result() const { return result_; }

private:
    Inventory &inventory_;
    const year_t reference_year_;
    ClearingResult result_;
};

/** Orders `agents` according to `policy` and runs one ClearingPass over `inventory`.
 *
 * \param agents the population; agents that already own a property are offered the market but
 * never buy again
 * \param inventory the market to clear
 * \param policy the clearing order
 * \param rng the engine driving the Random policy (unused by the income policies)
 * \param reference_year the year used for the new-construction test of FANCY agents
 */
ClearingResult clear(std::vector<Agent> &agents, Inventory &inventory, ClearingPolicy policy,
        random::rng_t &rng, year_t reference_year = default_reference_year);

}
