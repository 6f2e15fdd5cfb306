#pragma once
#include <dwell/types.hpp>
#include <dwell/Segment.hpp>
#include <dwell/Property.hpp>
#include <ostream>
#include <string>

namespace dwell {

class Inventory;

/** A prospective buyer in the housing market.
 *
 * An agent has a fixed income, a fixed demand segment, and a savings balance that is projected
 * once (see projectSavings()) and then spent, at most once, on a property during the clearing
 * process.  Once an agent owns a property it never searches again.
 */
class Agent {
public:
    /** Constructs an agent with the given attributes and no property.
     *
     * \param id the agent id
     * \param annual_income the annual income; must be strictly positive
     * \param dependents the number of dependents (children) of the agent
     * \param segment the demand segment
     * \param saving_rate the fraction of income saved every year
     * \param interest_rate the annual interest rate earned on savings; must not be negative
     * \param savings the initial savings balance; must not be negative
     *
     * \throws std::invalid_argument if any of the constraints above is violated
     */
    Agent(id_t id, double annual_income, int dependents, Segment segment,
            double saving_rate = 0.3, double interest_rate = 0.05, double savings = 0.0);

    id_t id() const { return id_; }
    double annualIncome() const { return annual_income_; }
    /// Monthly income, used as the OPTIMIZER price-per-area threshold
    double monthlyIncome() const { return annual_income_ / 12.0; }
    int dependents() const { return dependents_; }
    Segment segment() const { return segment_; }
    double savingRate() const { return saving_rate_; }
    double interestRate() const { return interest_rate_; }
    double savings() const { return savings_; }

    /// The property this agent bought, or nullptr if it has not bought one
    const Property* property() const { return property_; }
    /// True if this agent owns a property
    bool housed() const { return property_ != nullptr; }

    /** Sets the savings balance to the accumulated value of saving `savingRate() * annualIncome()`
     * at the end of each of `years` years, compounded annually at `interestRate()`:
     *
     * \f[ S = I s \frac{(1+r)^n - 1}{r} \f]
     *
     * With a zero interest rate this is the limiting value \f$ I s n \f$.
     *
     * \throws std::domain_error if `years` is negative
     */
    void projectSavings(int years);

    /** Attempts to buy a property from the inventory.
     *
     * The candidates are the available properties that suit this agent's segment:
     * - FANCY: new construction as of `reference_year` with the top (EXCELLENT) quality score;
     * - OPTIMIZER: a price per area no higher than the agent's monthly income;
     * - AVERAGE: a price no higher than the inventory's listed average price.
     *
     * Candidates are considered in inventory order, and the first one the agent can afford
     * (savings at least equal to the price) is bought: the property is marked sold, recorded as
     * the agent's property, and its price is deducted from savings.
     *
     * \returns true if a property was bought; false if nothing suitable was affordable, or if the
     * agent already owns a property (in which case the inventory is not searched).
     *
     * \throws dwell::division_by_zero_error if an OPTIMIZER agent evaluates a zero-area property
     */
    bool attemptPurchase(Inventory &inventory, year_t reference_year = default_reference_year);

    /// Returns a short description such as "Agent[3, AVERAGE]"
    explicit operator std::string() const;

private:
    // True if the property is one this agent's segment would consider buying
    bool suits(const Property &p, double listed_average, year_t reference_year) const;

    id_t id_;
    double annual_income_;
    int dependents_;
    Segment segment_;
    double saving_rate_;
    double interest_rate_;
    double savings_;
    const Property *property_ = nullptr;
};

/// Writes the string representation of the agent
std::ostream& operator<<(std::ostream &os, const Agent &a);

}
