#include <dwell/SimulationConfig.hpp>
#include <dwell/error.hpp>
#include <boost/format.hpp>
#include <cmath>

namespace dwell {

void IncomeDistribution::validate() const {
    using std::isfinite;
    if (not (isfinite(minimum) and isfinite(average) and isfinite(standard_deviation) and isfinite(maximum)))
        throw config_error("Income distribution parameters must be finite");
    if (not (minimum > 0))
        throw config_error("Minimum income must be positive");
    if (minimum > maximum)
        throw config_error((boost::format("Minimum income %1% exceeds maximum income %2%") % minimum % maximum).str());
    if (standard_deviation < 0)
        throw config_error("Income standard deviation cannot be negative");
}

void DependentsRange::validate() const {
    if (minimum < 0)
        throw config_error("Minimum number of dependents cannot be negative");
    if (minimum > maximum)
        throw config_error((boost::format("Minimum dependents %1% exceeds maximum dependents %2%") % minimum % maximum).str());
}

void SimulationConfig::validate() const {
    income.validate();
    dependents.validate();
    if (years < 0)
        throw config_error("Years of saving cannot be negative");
    if (not (down_payment_rate >= 0 and down_payment_rate <= 1))
        throw config_error("Down payment rate must be in [0, 1]");
    if (not (saving_rate >= 0 and saving_rate <= 1))
        throw config_error("Saving rate must be in [0, 1]");
    if (not (interest_rate >= 0) or not std::isfinite(interest_rate))
        throw config_error("Interest rate must be finite and non-negative");
    if (max_income_draws == 0)
        throw config_error("At least one income draw must be allowed");
    if (policy != ClearingPolicy::IncomeDescending and policy != ClearingPolicy::IncomeAscending
            and policy != ClearingPolicy::Random)
        throw config_error("Invalid clearing policy");
}

}
