#ifndef PLS_PREP_RANDOM_STATE_HPP
#define PLS_PREP_RANDOM_STATE_HPP

/**
 * @file random_state.hpp
 * @brief Seedable random state and seed resolution
 *
 * Resampling routines (permutation tests, bootstrap) accept a seed
 * specification and resolve it through get_seed():
 * - no seed        -> shared process-wide default state
 * - integer seed   -> fresh RandomState seeded with that value
 * - existing state -> returned unchanged
 *
 * The default state is shared mutable state and is not synchronized.
 * Code that needs reproducible or thread-isolated draws should pass an
 * explicit seed or state.
 */

#include <cstdint>
#include <memory>
#include <random>
#include <variant>
#include <vector>

namespace pls::rng {

/**
 * @brief Pseudo-random number generator backed by a 32-bit Mersenne Twister
 */
class RandomState {
public:
    /// Construct seeded from std::random_device
    RandomState();

    /// Construct with a fixed seed
    explicit RandomState(std::uint32_t seed);

    /// Reseed the generator
    void seed(std::uint32_t seed);

    /**
     * @brief Draw from the uniform distribution on [low, high)
     */
    double uniform(double low = 0.0, double high = 1.0);

    /**
     * @brief Draw from the standard normal distribution
     */
    double standard_normal();

    /**
     * @brief Draw integers uniformly from [low, high) with replacement
     *
     * Used to build bootstrap resamples of observation indices.
     *
     * @param low Inclusive lower bound
     * @param high Exclusive upper bound
     * @param size Number of draws
     * @throws std::invalid_argument if low >= high
     */
    std::vector<std::int64_t> randint(std::int64_t low, std::int64_t high, size_t size);

    /**
     * @brief Random permutation of 0..n-1
     * @throws std::invalid_argument if n is negative
     */
    std::vector<std::int64_t> permutation(std::int64_t n);

    /// Underlying engine, for use with <random> distributions
    std::mt19937& engine() noexcept { return engine_; }

private:
    std::mt19937 engine_;
};

/**
 * @brief Seed specification accepted by get_seed()
 *
 * - std::monostate: use the default random state
 * - std::int64_t: seed a new RandomState, must be in [0, 2^32 - 1]
 * - std::shared_ptr<RandomState>: use this state (null means default)
 */
using SeedSpec = std::variant<std::monostate, std::int64_t, std::shared_ptr<RandomState>>;

/// Largest accepted integer seed
constexpr std::int64_t MAX_SEED = 4294967295LL;

/**
 * @brief Resolve a seed specification into a random state
 *
 * @param seed Seed specification (default: unseeded)
 * @return Random state to draw from
 * @throws std::invalid_argument if an integer seed is outside [0, 2^32 - 1]
 */
std::shared_ptr<RandomState> get_seed(const SeedSpec& seed = SeedSpec{});

/**
 * @brief Process-wide default random state
 *
 * Created on first use and seeded from std::random_device.
 */
std::shared_ptr<RandomState> default_random_state();

/**
 * @brief Replace the process-wide default random state
 *
 * @param state New default; a null pointer installs a freshly seeded state
 */
void set_default_random_state(std::shared_ptr<RandomState> state);

}  // namespace pls::rng

#endif  // PLS_PREP_RANDOM_STATE_HPP
