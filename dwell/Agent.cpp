#include <dwell/Agent.hpp>
#include <dwell/Inventory.hpp>
#include <dwell/error.hpp>
#include <dwell/debug.hpp>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace dwell {

Agent::Agent(id_t id, double annual_income, int dependents, Segment segment,
        double saving_rate, double interest_rate, double savings)
    : id_{id}, annual_income_{annual_income}, dependents_{dependents}, segment_{segment},
    saving_rate_{saving_rate}, interest_rate_{interest_rate}, savings_{savings}
{
    // Rejects out-of-range enum values
    to_string(segment);

    if (not (annual_income > 0))
        throw std::invalid_argument("Agent " + std::to_string(id) + " must have a positive annual income");
    if (dependents < 0)
        throw std::invalid_argument("Agent " + std::to_string(id) + " cannot have a negative number of dependents");
    if (saving_rate < 0)
        throw std::invalid_argument("Agent " + std::to_string(id) + " cannot have a negative saving rate");
    if (interest_rate < 0)
        throw std::invalid_argument("Agent " + std::to_string(id) + " cannot have a negative interest rate");
    if (savings < 0)
        throw std::invalid_argument("Agent " + std::to_string(id) + " cannot have negative savings");
}

void Agent::projectSavings(int years) {
    if (years < 0)
        throw std::domain_error("Cannot project savings over a negative number of years");

    const double annual_savings = annual_income_ * saving_rate_;
    if (interest_rate_ == 0)
        savings_ = annual_savings * years;
    else
        savings_ = annual_savings * (std::pow(1.0 + interest_rate_, years) - 1.0) / interest_rate_;
}

bool Agent::suits(const Property &p, double listed_average, year_t reference_year) const {
    switch (segment_) {
        case Segment::FANCY:
            return p.isNewConstruction(reference_year) and p.qualityScore() and *p.qualityScore() == QualityScore::EXCELLENT;
        case Segment::OPTIMIZER:
            return p.pricePerArea() <= monthlyIncome();
        case Segment::AVERAGE:
            return p.price() <= listed_average;
    }
    throw invalid_segment_error("Invalid segment value " + std::to_string(static_cast<int>(segment_)));
}

bool Agent::attemptPurchase(Inventory &inventory, year_t reference_year) {
    if (housed()) return false;

    const double listed_average = segment_ == Segment::AVERAGE ? inventory.listedAveragePrice() : 0.0;

    std::vector<Property*> candidates;
    for (auto &p : inventory) {
        if (p.available() and suits(p, listed_average, reference_year))
            candidates.push_back(&p);
    }

    for (Property *p : candidates) {
        if (savings_ >= p->price()) {
            property_ = p;
            p->markSold();
            savings_ -= p->price();
            DWELL_DBG("Agent " << id_ << " bought property " << p->id() << " for $" << p->price());
            return true;
        }
    }

    DWELL_DBG("Agent " << id_ << " (" << segment_ << ") could not find a suitable property to buy");
    return false;
}

Agent::operator std::string() const {
    return "Agent[" + std::to_string(id_) + ", " + to_string(segment_) + "]";
}

std::ostream& operator<<(std::ostream &os, const Agent &a) {
    return os << std::string(a);
}

}
