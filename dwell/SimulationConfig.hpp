#pragma once
#include <dwell/types.hpp>
#include <dwell/Clearing.hpp>
#include <dwell/random/rng.hpp>
#include <boost/optional.hpp>

namespace dwell {

/** Parameters of the bounded normal distribution that agent incomes are drawn from.  Draws
 * outside `[minimum, maximum]` are rejected and redrawn.
 */
struct IncomeDistribution {
    double minimum = 10000;
    double average = 50000;
    double standard_deviation = 20000;
    double maximum = 250000;

    /** \throws dwell::config_error unless `0 < minimum <= maximum`, all values are finite, and
     * `standard_deviation >= 0`.
     */
    void validate() const;
};

/** Closed range of the uniformly drawn number of dependents of each agent. */
struct DependentsRange {
    int minimum = 0;
    int maximum = 5;

    /// \throws dwell::config_error unless `0 <= minimum <= maximum`
    void validate() const;
};

/** The configuration of a Simulation run.  All values have usable defaults; set the ones that
 * matter and call validate() (Simulation's constructor does this).
 */
struct SimulationConfig {
    /// The number of agents generated by Simulation::generatePopulation()
    size_t population = 100;
    /// The number of years of saving before the market clears
    int years = 10;
    /// Income distribution of generated agents
    IncomeDistribution income;
    /// Dependents range of generated agents
    DependentsRange dependents;
    /** Down-payment share of the price.  Purchases are paid in full from savings (there are no
     * mortgages), so this is carried for downstream reporting only.
     */
    double down_payment_rate = 0.2;
    /// Fraction of annual income each generated agent saves
    double saving_rate = 0.3;
    /// Annual interest rate earned on savings
    double interest_rate = 0.05;
    /// The order in which agents are offered the market
    ClearingPolicy policy = ClearingPolicy::IncomeDescending;
    /// The year against which property ages are measured
    year_t reference_year = default_reference_year;
    /// If true, buildMarket() assigns a quality score to every property that lacks one
    bool derive_quality_scores = false;
    /// Maximum number of normal draws attempted for a single in-range income
    unsigned long max_income_draws = 10000;
    /** Maximum number of threads used to project savings; 0 (the default) projects on the calling
     * thread.  Clearing is always single-threaded.
     */
    unsigned int max_threads = 0;
    /** Seed of the simulation's random engine.  If unset, the process-wide default seed is used
     * (see dwell::random::seed(), which honours the DWELL_RNG_SEED environment variable).
     */
    boost::optional<random::rng_t::result_type> seed;

    /// \throws dwell::config_error if any value is out of range
    void validate() const;
};

}
