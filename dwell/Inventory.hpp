#pragma once
#include <dwell/types.hpp>
#include <dwell/Property.hpp>
#include <dwell/Segment.hpp>
#include <boost/optional.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace dwell {

/** The housing market: the complete, fixed collection of properties available to a simulation.
 *
 * The set of properties is fixed at construction; no property is ever added or removed afterwards.
 * The only mutation is a property's own state (availability, quality score), so references and
 * pointers to the contained properties stay valid for the lifetime of the Inventory, including
 * across moves of the Inventory itself.
 *
 * Iteration visits properties in load order; the clearing process evaluates candidates in this
 * order.
 */
class Inventory {
public:
    /// Constructs an empty inventory.
    Inventory() = default;

    /** Constructs an inventory holding the given properties.
     *
     * \throws std::invalid_argument if two properties share an id
     */
    explicit Inventory(std::vector<Property> properties);

    using const_iterator = std::vector<Property>::const_iterator;
    using iterator = std::vector<Property>::iterator;

    const_iterator begin() const { return properties_.begin(); }
    const_iterator end() const { return properties_.end(); }
    iterator begin() { return properties_.begin(); }
    iterator end() { return properties_.end(); }

    /// The number of properties (sold or not)
    size_t size() const { return properties_.size(); }
    /// True if the inventory holds no properties at all
    bool empty() const { return properties_.empty(); }
    /// The number of properties still for sale
    size_t countAvailable() const;

    /** Returns the property with the given id.
     *
     * \throws dwell::not_found_error if there is no such property
     */
    Property& findById(id_t id);
    /// const version of the above
    const Property& findById(id_t id) const;

    /** Returns the mean price of the available properties, optionally restricted to properties
     * with exactly `bedrooms` bedrooms.  Returns 0 when no property qualifies.
     */
    double averagePrice(boost::optional<int> bedrooms = boost::none) const;

    /** Returns the mean price of every property in the inventory, sold or not.  This is the
     * reference price AVERAGE buyers compare against.  Returns 0 for an empty inventory.
     */
    double listedAveragePrice() const;

    /** Returns the available properties priced at or below `max_price` that also satisfy the
     * requirement of the given segment:
     * - FANCY: a quality score of at least 4 has been assigned;
     * - OPTIMIZER: the area is positive and the price per area is below `max_price / area`;
     * - AVERAGE: no further requirement.
     *
     * The returned pointers refer to properties owned by this inventory, in inventory order.  An
     * empty vector means nothing matched.
     *
     * \throws dwell::invalid_segment_error if `segment` is not a valid Segment value
     */
    std::vector<const Property*> matchingRequirements(double max_price, Segment segment) const;

    /** Same as above, but takes the textual segment tag.
     *
     * \throws dwell::invalid_segment_error if `segment` is not "FANCY", "OPTIMIZER" or "AVERAGE"
     */
    std::vector<const Property*> matchingRequirements(double max_price, const std::string &segment) const;

private:
    std::vector<Property> properties_;
    std::unordered_map<id_t, size_t> index_;
};

}
