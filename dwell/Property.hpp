#pragma once
#include <dwell/types.hpp>
#include <boost/optional.hpp>
#include <ostream>
#include <string>

namespace dwell {

/** Ordinal quality levels of a property, from 1 (POOR) to 5 (EXCELLENT). */
enum class QualityScore {
    POOR = 1,
    FAIR = 2,
    AVERAGE = 3,
    GOOD = 4,
    EXCELLENT = 5
};

/** A single property in a housing market.
 *
 * The descriptive attributes (id, price, area, bedrooms, construction year) are fixed at
 * construction.  Two attributes can change during a run, each in one direction only:
 * - the quality score can go from unassigned to assigned (via assignQualityScore()), and is never
 *   changed once assigned;
 * - the availability flag can go from available to sold (via markSold()), and is never reversed.
 *
 * Properties are owned by an Inventory; agents refer to the property they bought by pointer.
 */
class Property {
public:
    /** Constructs a property.
     *
     * \param id the property id; must be unique within the Inventory it is placed in
     * \param price the asking price; must be strictly positive
     * \param area the floor area; may be 0, but pricePerArea() then throws
     * \param bedrooms the number of bedrooms
     * \param year_built the construction year
     * \param quality an optional pre-assigned quality score
     * \param available whether the property is initially for sale
     *
     * \throws std::invalid_argument if `price` is not strictly positive or `area` is negative
     */
    Property(id_t id, double price, double area, int bedrooms, year_t year_built,
            boost::optional<QualityScore> quality = boost::none, bool available = true);

    id_t id() const { return id_; }
    double price() const { return price_; }
    double area() const { return area_; }
    int bedrooms() const { return bedrooms_; }
    year_t yearBuilt() const { return year_built_; }

    /// The quality score, if one has been assigned
    const boost::optional<QualityScore>& qualityScore() const { return quality_; }

    /// True until the property is sold
    bool available() const { return available_; }

    /** Returns the price per unit of area, rounded to 2 decimal places.  Exact half-cents round
     * away from zero (1.125 becomes 1.13), as std::round does.
     *
     * \throws dwell::division_by_zero_error if the area is 0
     */
    double pricePerArea() const;

    /** Returns true if the property is less than 5 years old as of `reference_year`. */
    bool isNewConstruction(year_t reference_year = default_reference_year) const;

    /** Assigns a quality score derived from the property's age, area and bedroom count, unless a
     * score is already assigned (in which case this does nothing).
     *
     * The base score comes from the age as of `reference_year`: under 5 years scores 5, under 15
     * scores 4, under 30 scores 3, under 50 scores 2, anything older 1.  One point is added for an
     * area above 2000 and one for more than 3 bedrooms, and the total is capped at 5.
     *
     * \returns the (possibly pre-existing) quality score
     */
    QualityScore assignQualityScore(year_t reference_year = default_reference_year);

    /** Marks the property as sold.  Calling this on an already-sold property has no effect. */
    void markSold() { available_ = false; }

    /// Returns a short description such as "Property[7, $100000]"
    explicit operator std::string() const;

private:
    id_t id_;
    double price_;
    double area_;
    int bedrooms_;
    year_t year_built_;
    boost::optional<QualityScore> quality_;
    bool available_;
};

/// Writes the numeric value of the quality score
std::ostream& operator<<(std::ostream &os, QualityScore q);

/// Writes the string representation of the property
std::ostream& operator<<(std::ostream &os, const Property &p);

}
