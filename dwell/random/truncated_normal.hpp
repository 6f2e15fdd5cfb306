#pragma once
#include <boost/optional.hpp>
#include <boost/random/normal_distribution.hpp>

namespace dwell { namespace random {

/** Performs rejection sampling from a normal distribution, rejecting any draws outside the range
 * `[lower, upper]`.  This is naive rejection sampling: draws from the untruncated N(mu, sigma)
 * distribution are taken until one lands inside the range.
 *
 * Unlike an unbounded rejection loop, at most `max_draws` values are drawn.  If none of them is
 * admissible, an empty optional is returned; this happens in practice only when the range lies
 * far out in a tail of the distribution (or when `sigma` is 0 and `mu` is outside the range), and
 * callers are expected to treat it as a configuration problem.
 *
 * \param eng the random engine used to obtain draws
 * \param mu the mean of the untruncated normal distribution
 * \param sigma the standard deviation of the untruncated normal distribution; must be >= 0
 * \param lower the lower truncation point (inclusive)
 * \param upper the upper truncation point (inclusive)
 * \param max_draws the maximum number of draws to attempt
 */
template <class Engine, class RealType>
boost::optional<RealType> truncnorm_rejection_bounded(Engine &eng, const RealType &mu, const RealType &sigma,
        const RealType &lower, const RealType &upper, unsigned long max_draws) {
    boost::random::normal_distribution<RealType> normal(mu, sigma);
    for (unsigned long i = 0; i < max_draws; i++) {
        RealType x = normal(eng);
        if (x >= lower and x <= upper) return x;
    }
    return boost::none;
}

}}
