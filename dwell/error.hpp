#pragma once
#include <stdexcept>
#include <string>

/** \file dwell/error.hpp
 *
 * Exception classes thrown by dwell.  Each derives from the standard exception that best describes
 * it, so callers may catch either the specific dwell type or the standard base.
 *
 * Normal outcomes of the matching process (an agent that finds nothing affordable, a property that
 * finds no buyer) are never reported through exceptions.
 */

namespace dwell {

/** Thrown when looking up a property id that the inventory does not contain. */
class not_found_error : public std::out_of_range {
public:
    explicit not_found_error(const std::string &what) : std::out_of_range(what) {}
};

/** Thrown when computing a price-per-area value for a property with a zero area. */
class division_by_zero_error : public std::domain_error {
public:
    explicit division_by_zero_error(const std::string &what) : std::domain_error(what) {}
};

/** Thrown when a segment tag (or an out-of-range Segment value) is not one of FANCY, OPTIMIZER or
 * AVERAGE.
 */
class invalid_segment_error : public std::invalid_argument {
public:
    explicit invalid_segment_error(const std::string &what) : std::invalid_argument(what) {}
};

/** Thrown when a Simulation operation is invoked out of order, for example clearing the market
 * before a population exists, or reading outcome metrics before the market has been cleared.
 */
class invalid_state_error : public std::logic_error {
public:
    explicit invalid_state_error(const std::string &what) : std::logic_error(what) {}
};

/** Thrown when a SimulationConfig is inconsistent, or when its income distribution cannot produce
 * an in-range draw within the configured sampling budget.
 */
class config_error : public invalid_state_error {
public:
    explicit config_error(const std::string &what) : invalid_state_error(what) {}
};

}
