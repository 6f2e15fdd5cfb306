#include <dwell/Simulation.hpp>
#include <dwell/error.hpp>
#include <dwell/debug.hpp>
#include <dwell/random/truncated_normal.hpp>
#include <boost/format.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <boost/thread/locks.hpp>
#include <algorithm>
#include <exception>
#include <stdexcept>
#include <thread>
#include <unordered_set>
#include <utility>

namespace dwell {

Simulation::Simulation(SimulationConfig config) : config_{std::move(config)} {
    config_.validate();
    seed_ = config_.seed ? *config_.seed : random::seed();
    rng_.seed(seed_);
}

Simulation::Stage Simulation::stage() const {
    boost::shared_lock<boost::shared_mutex> lock(run_mutex_);
    return stage_;
}

void Simulation::require(Stage required, const char *operation) const {
    if (stage_ != required)
        throw invalid_state_error((boost::format("Cannot %1%: simulation is at stage %2%, but %3% is required")
                    % operation % stage_ % required).str());
}

void Simulation::buildMarket(const std::vector<MarketRow> &rows) {
    boost::unique_lock<boost::shared_mutex> lock(run_mutex_);
    require(Stage::Uninitialized, "build the market");

    std::vector<Property> properties;
    properties.reserve(rows.size());
    for (const auto &row : rows) {
        properties.emplace_back(row.id, row.price, row.area, row.bedrooms, row.year_built,
                row.quality_score, row.available.value_or(true));
        if (config_.derive_quality_scores)
            properties.back().assignQualityScore(config_.reference_year);
    }

    inventory_ = Inventory(std::move(properties));
    stage_ = Stage::MarketBuilt;
    DWELL_DBG("Built market of " << inventory_.size() << " properties (" << inventory_.countAvailable() << " for sale)");
}

void Simulation::generatePopulation(size_t count, const IncomeDistribution &income, const DependentsRange &dependents) {
    boost::unique_lock<boost::shared_mutex> lock(run_mutex_);
    require(Stage::MarketBuilt, "generate the population");
    income.validate();
    dependents.validate();

    boost::random::uniform_int_distribution<int> dependents_dist(dependents.minimum, dependents.maximum);
    boost::random::uniform_int_distribution<int> segment_dist(0, segment_count - 1);

    std::vector<Agent> agents;
    agents.reserve(count);
    for (size_t i = 0; i < count; i++) {
        auto draw = random::truncnorm_rejection_bounded(rng_, income.average, income.standard_deviation,
                income.minimum, income.maximum, config_.max_income_draws);
        if (not draw)
            throw config_error((boost::format("No income within [%1%, %2%] after %3% draws from N(%4%, %5%)")
                        % income.minimum % income.maximum % config_.max_income_draws
                        % income.average % income.standard_deviation).str());

        const int children = dependents_dist(rng_);
        const Segment segment = static_cast<Segment>(segment_dist(rng_));
        agents.emplace_back(i + 1, *draw, children, segment, config_.saving_rate, config_.interest_rate);
    }

    agents_ = std::move(agents);
    stage_ = Stage::PopulationBuilt;
    DWELL_DBG("Generated " << agents_.size() << " agents");
}

void Simulation::generatePopulation() {
    generatePopulation(config_.population, config_.income, config_.dependents);
}

void Simulation::adoptPopulation(std::vector<Agent> agents) {
    boost::unique_lock<boost::shared_mutex> lock(run_mutex_);
    require(Stage::MarketBuilt, "adopt a population");

    std::unordered_set<id_t> seen;
    for (const auto &a : agents) {
        if (not seen.insert(a.id()).second)
            throw std::invalid_argument("Duplicate agent id " + std::to_string(a.id()) + " in population");
        if (a.housed())
            throw std::invalid_argument("Agent " + std::to_string(a.id()) + " already owns a property");
    }

    agents_ = std::move(agents);
    stage_ = Stage::PopulationBuilt;
}

void Simulation::projectAllSavings(int years) {
    boost::unique_lock<boost::shared_mutex> lock(run_mutex_);
    require(Stage::PopulationBuilt, "project savings");
    if (years < 0)
        throw std::domain_error("Cannot project savings over a negative number of years");

    const size_t threads = std::min<size_t>(config_.max_threads, agents_.size());
    if (threads <= 1) {
        for (auto &a : agents_) a.projectSavings(years);
    }
    else {
        // Each thread writes only to its own contiguous block of agents
        const size_t block = (agents_.size() + threads - 1) / threads;
        std::vector<std::exception_ptr> failures(threads);
        std::vector<std::thread> pool;
        pool.reserve(threads);
        for (size_t t = 0; t < threads; t++) {
            pool.emplace_back([this, t, block, years, &failures] {
                try {
                    const size_t end = std::min(agents_.size(), (t + 1) * block);
                    for (size_t i = t * block; i < end; i++) agents_[i].projectSavings(years);
                }
                catch (...) {
                    failures[t] = std::current_exception();
                }
            });
        }
        for (auto &thr : pool) thr.join();
        for (auto &f : failures) if (f) std::rethrow_exception(f);
    }

    stage_ = Stage::SavingsProjected;
    DWELL_DBG("Projected savings of " << agents_.size() << " agents over " << years << " years");
}

void Simulation::projectAllSavings() {
    projectAllSavings(config_.years);
}

const ClearingResult& Simulation::clearMarket(ClearingPolicy policy) {
    boost::unique_lock<boost::shared_mutex> lock(run_mutex_);
    require(Stage::SavingsProjected, "clear the market");

    auto ordered = order(agents_, policy, rng_);
    std::vector<id_t> clearing_order;
    clearing_order.reserve(ordered.size());
    for (const Agent *a : ordered) clearing_order.push_back(a->id());

    ClearingPass pass(inventory_, config_.reference_year);
    clearing_order_ = std::move(clearing_order);
    try {
        pass.run(ordered);
    }
    catch (...) {
        // Purchases made before the failure stay applied; record them and refuse further stages
        clearing_ = pass.result();
        stage_ = Stage::Failed;
        DWELL_DBG("Clearing failed after " << clearing_.offered << " offers and " << clearing_.purchases.size() << " purchases");
        throw;
    }
    clearing_ = pass.result();
    stage_ = Stage::Cleared;

    DWELL_DBG("Cleared market with policy " << policy << ": " << clearing_.purchases.size() << " purchases, "
            << inventory_.countAvailable() << " of " << inventory_.size() << " properties unsold");
    return clearing_;
}

const ClearingResult& Simulation::clearMarket() {
    return clearMarket(config_.policy);
}

Outcome Simulation::run(const std::vector<MarketRow> &rows) {
    DWELL_TDBG("Starting run with seed " << seed_);
    buildMarket(rows);
    generatePopulation();
    projectAllSavings();
    clearMarket();
    return outcome();
}

namespace {
double rate(size_t part, size_t whole) {
    return whole == 0 ? 0.0 : double(part) / double(whole);
}

size_t count_housed(const std::vector<Agent> &agents) {
    return std::count_if(agents.begin(), agents.end(), [](const Agent &a) { return a.housed(); });
}
}

double Simulation::ownershipRate() const {
    boost::shared_lock<boost::shared_mutex> lock(run_mutex_);
    require(Stage::Cleared, "compute the ownership rate");
    return rate(count_housed(agents_), agents_.size());
}

double Simulation::availabilityRate() const {
    boost::shared_lock<boost::shared_mutex> lock(run_mutex_);
    require(Stage::Cleared, "compute the availability rate");
    return rate(inventory_.countAvailable(), inventory_.size());
}

Outcome Simulation::outcome() const {
    boost::shared_lock<boost::shared_mutex> lock(run_mutex_);
    require(Stage::Cleared, "summarize the outcome");
    Outcome o;
    o.agents = agents_.size();
    o.housed = count_housed(agents_);
    o.properties = inventory_.size();
    o.available = inventory_.countAvailable();
    o.ownership_rate = rate(o.housed, o.agents);
    o.availability_rate = rate(o.available, o.properties);
    return o;
}

std::string to_string(Simulation::Stage stage) {
    switch (stage) {
        case Simulation::Stage::Uninitialized:    return "Uninitialized";
        case Simulation::Stage::MarketBuilt:      return "MarketBuilt";
        case Simulation::Stage::PopulationBuilt:  return "PopulationBuilt";
        case Simulation::Stage::SavingsProjected: return "SavingsProjected";
        case Simulation::Stage::Cleared:          return "Cleared";
        case Simulation::Stage::Failed:           return "Failed";
    }
    return "Stage[" + std::to_string(static_cast<int>(stage)) + "]";
}

std::ostream& operator<<(std::ostream &os, Simulation::Stage stage) {
    return os << to_string(stage);
}

}
