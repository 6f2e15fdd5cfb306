#pragma once
#include <dwell/types.hpp>
#include <dwell/Property.hpp>
#include <boost/optional.hpp>

namespace dwell {

/** One record of market seed data, as produced by an external tabular loader.  Each row becomes
 * exactly one Property when a Simulation builds its market.
 */
struct MarketRow {
    id_t id = 0;
    double price = 0;
    double area = 0;
    int bedrooms = 0;
    year_t year_built = 0;
    /// Optional pre-assigned quality score
    boost::optional<QualityScore> quality_score;
    /// Optional availability; rows without one are for sale
    boost::optional<bool> available;
};

}
