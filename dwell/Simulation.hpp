#pragma once
#include <dwell/types.hpp>
#include <dwell/Agent.hpp>
#include <dwell/Clearing.hpp>
#include <dwell/Inventory.hpp>
#include <dwell/MarketRow.hpp>
#include <dwell/SimulationConfig.hpp>
#include <dwell/noncopyable.hpp>
#include <dwell/random/rng.hpp>
#include <boost/thread/shared_mutex.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace dwell {

/** Summary of a cleared market. */
struct Outcome {
    /// Fraction of agents that own a property
    double ownership_rate = 0;
    /// Fraction of properties still for sale
    double availability_rate = 0;
    /// Number of agents
    size_t agents = 0;
    /// Number of agents owning a property
    size_t housed = 0;
    /// Number of properties
    size_t properties = 0;
    /// Number of properties still for sale
    size_t available = 0;
};

/** This class owns a complete housing-market run: it builds the market, creates the population,
 * projects the agents' savings, clears the market, and reports the outcome.
 *
 * A run moves through the stages of Simulation::Stage strictly in order, one step per operation:
 *
 *     Uninitialized --buildMarket()--> MarketBuilt
 *                   --generatePopulation() or adoptPopulation()--> PopulationBuilt
 *                   --projectAllSavings()--> SavingsProjected
 *                   --clearMarket()--> Cleared
 *
 * Calling an operation in any other stage (including repeating one) throws an
 * invalid_state_error; the simulation is left unchanged.  If an operation throws for any other
 * reason, the stage is not advanced either, with one exception: a clearMarket() that fails partway
 * has already transferred some properties, so it moves the simulation to the terminal Failed stage,
 * in which every further operation and outcome query throws invalid_state_error.  purchases() and
 * clearingOrder() still describe what the failed pass did.
 *
 * All randomness (incomes, dependents, segments, random clearing order) comes from an engine owned
 * by the simulation and seeded once at construction, so two simulations with the same seed,
 * configuration and market data produce identical ownership assignments.
 *
 * Stage operations hold an exclusive lock and stage(), the rate queries and outcome() a shared
 * lock, so those may be called from other threads while a stage runs.  The reference accessors
 * (inventory(), agents(), purchases(), clearingOrder()) are not synchronized: only use them when no
 * stage operation can run concurrently.
 */
class Simulation final : private noncopyable {
public:
    /// The lifecycle stages of a simulation
    enum class Stage { Uninitialized, MarketBuilt, PopulationBuilt, SavingsProjected, Cleared, Failed };

    /** Creates a simulation with the given configuration.
     *
     * \throws dwell::config_error if the configuration is invalid
     */
    explicit Simulation(SimulationConfig config = SimulationConfig());

    /// The configuration the simulation was created with
    const SimulationConfig& config() const { return config_; }

    /// The seed of the simulation's random engine
    random::rng_t::result_type seed() const { return seed_; }

    /// The current lifecycle stage
    Stage stage() const;

    /** Builds the market from external rows, one Property per row.  If the configuration sets
     * `derive_quality_scores`, properties without a quality score get one derived as of the
     * configured reference year.
     *
     * \throws dwell::invalid_state_error unless the stage is Uninitialized
     * \throws std::invalid_argument for a row with a non-positive price, a negative area, or a
     * duplicated id
     */
    void buildMarket(const std::vector<MarketRow> &rows);

    /** Generates `count` agents with ids 1 to `count`.  Each agent's income is drawn from the
     * normal distribution `income` describes, redrawing until it falls within its bounds; the number
     * of dependents is uniform over `dependents`, and the segment is uniform over the three
     * segments.  Saving and interest rates come from the configuration.
     *
     * \throws dwell::invalid_state_error unless the stage is MarketBuilt
     * \throws dwell::config_error if the parameters are invalid, or if no in-range income is drawn
     * within the configured `max_income_draws` attempts
     */
    void generatePopulation(size_t count, const IncomeDistribution &income, const DependentsRange &dependents);

    /// Same as above, using the population, income and dependents settings of the configuration
    void generatePopulation();

    /** Uses an externally built population instead of generating one.  Agents keep their own
     * rates and savings.
     *
     * \throws dwell::invalid_state_error unless the stage is MarketBuilt
     * \throws std::invalid_argument if two agents share an id, or an agent already owns a property
     */
    void adoptPopulation(std::vector<Agent> agents);

    /** Projects every agent's savings over `years` years (see Agent::projectSavings()).  With a
     * positive `max_threads` setting the agents are split across up to that many threads, all of
     * which finish before this returns.
     *
     * \throws dwell::invalid_state_error unless the stage is PopulationBuilt
     * \throws std::domain_error if `years` is negative
     */
    void projectAllSavings(int years);

    /// Same as above, using the configured number of years
    void projectAllSavings();

    /** Orders the agents by `policy` and offers each of them the market once, in that order.
     *
     * \throws dwell::invalid_state_error unless the stage is SavingsProjected
     * \throws dwell::division_by_zero_error if an OPTIMIZER agent evaluates a zero-area property;
     * the simulation is then in the Failed stage
     */
    const ClearingResult& clearMarket(ClearingPolicy policy);

    /// Same as above, using the configured policy
    const ClearingResult& clearMarket();

    /** Runs every stage with the configured settings and returns the outcome.
     *
     * \throws dwell::invalid_state_error unless the stage is Uninitialized
     */
    Outcome run(const std::vector<MarketRow> &rows);

    /** The fraction of agents that own a property; 0 for an empty population.
     *
     * \throws dwell::invalid_state_error unless the stage is Cleared
     */
    double ownershipRate() const;

    /** The fraction of properties still for sale; 0 for an empty inventory.
     *
     * \throws dwell::invalid_state_error unless the stage is Cleared
     */
    double availabilityRate() const;

    /** The full outcome summary.
     *
     * \throws dwell::invalid_state_error unless the stage is Cleared
     */
    Outcome outcome() const;

    // Unsynchronized accessors; see the class description.

    /// The market.  Empty before buildMarket().
    const Inventory& inventory() const { return inventory_; }
    /// The agents, in population order.  Empty before the population stage.
    const std::vector<Agent>& agents() const { return agents_; }
    /// Purchases made while clearing, in purchase order.  Empty before clearMarket().
    const std::vector<Purchase>& purchases() const { return clearing_.purchases; }
    /// Agent ids in the order they were offered the market.  Empty before clearMarket().
    const std::vector<id_t>& clearingOrder() const { return clearing_order_; }

private:
    // Throws invalid_state_error unless the current stage is `required`.  Caller holds the lock.
    void require(Stage required, const char *operation) const;

    SimulationConfig config_;
    random::rng_t::result_type seed_;
    random::rng_t rng_;

    Stage stage_ = Stage::Uninitialized;
    Inventory inventory_;
    std::vector<Agent> agents_;
    std::vector<id_t> clearing_order_;
    ClearingResult clearing_;

    mutable boost::shared_mutex run_mutex_;
};

/// Returns the stage name, e.g. "SavingsProjected"
std::string to_string(Simulation::Stage stage);
/// Writes the stage name to the stream
std::ostream& operator<<(std::ostream &os, Simulation::Stage stage);

}
