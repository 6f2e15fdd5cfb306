#include <dwell/random/rng.hpp>
#include <cstdlib>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>

namespace dwell { namespace random {

namespace {
std::mutex lock_;
bool init_done_ = false;
rng_t::result_type seed_;
}

rng_t::result_type seed() {
    // Lock out other threads: we're checking/setting global variables here
    std::unique_lock<std::mutex> lock(lock_);
    if (!init_done_) {
        const char *envseed = std::getenv("DWELL_RNG_SEED");
        bool found_env = false;
        if (envseed) {
            std::string seedstr(envseed);
            if (not seedstr.empty()) {
                try {
                    seed_ = std::stoull(seedstr);
                }
                catch (const std::logic_error&) {
                    throw std::invalid_argument("DWELL_RNG_SEED is not a valid seed: " + seedstr);
                }
                found_env = true;
            }
        }

        if (!found_env) {
            std::random_device rd;
            seed_ = (rng_t::result_type(rd()) << 32) | rd();
        }

        init_done_ = true;
    }

    return seed_;
}

}}
