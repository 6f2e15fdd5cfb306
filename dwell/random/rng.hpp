#pragma once
#include <boost/random/mersenne_twister.hpp>
#include <dwell/noncopyable.hpp>

namespace dwell {
/// Namespace for random number generation used by population generation and random clearing
namespace random {

/** The dwell RNG class, currently boost::random::mt19937_64.  The wrapper class is non-copyable,
 * so that an engine whose sequence matters for reproducibility (such as the one owned by a
 * Simulation) cannot be silently duplicated.
 */
class rng_t : public boost::random::mt19937_64, private dwell::noncopyable {
public:
    /// Default-seeded engine; call seed() before relying on its sequence.
    rng_t() = default;
    /// Engine seeded with the given value.
    explicit rng_t(result_type s) : boost::random::mt19937_64(s) {}
};

/** Returns the default seed of the process: the seed of every Simulation whose configuration does
 * not set one.
 *
 * The value is established by the first call.  If the environment variable DWELL_RNG_SEED is set
 * and non-empty, its value is used; otherwise a seed is obtained from the operating system via
 * std::random_device.  Later calls, from any thread, return the same value, so setting
 * DWELL_RNG_SEED is enough to make a run reproducible.
 *
 * \throws std::invalid_argument if DWELL_RNG_SEED is not a number
 */
rng_t::result_type seed();

}}
