#include "random_state.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

namespace pls::rng {

namespace {

std::shared_ptr<RandomState>& default_slot() {
    static std::shared_ptr<RandomState> state = std::make_shared<RandomState>();
    return state;
}

}  // anonymous namespace

RandomState::RandomState() : engine_(std::random_device{}()) {}

RandomState::RandomState(std::uint32_t seed) : engine_(seed) {}

void RandomState::seed(std::uint32_t seed) {
    engine_.seed(seed);
}

double RandomState::uniform(double low, double high) {
    std::uniform_real_distribution<double> dist(low, high);
    return dist(engine_);
}

double RandomState::standard_normal() {
    std::normal_distribution<double> dist(0.0, 1.0);
    return dist(engine_);
}

std::vector<std::int64_t> RandomState::randint(std::int64_t low, std::int64_t high, size_t size) {
    if (low >= high) {
        throw std::invalid_argument("randint: low must be less than high (low=" +
                                    std::to_string(low) + ", high=" + std::to_string(high) + ")");
    }

    std::uniform_int_distribution<std::int64_t> dist(low, high - 1);
    std::vector<std::int64_t> draws(size);
    for (auto& d : draws) {
        d = dist(engine_);
    }
    return draws;
}

std::vector<std::int64_t> RandomState::permutation(std::int64_t n) {
    if (n < 0) {
        throw std::invalid_argument("permutation: n must be non-negative, got " +
                                    std::to_string(n));
    }

    std::vector<std::int64_t> perm(static_cast<size_t>(n));
    std::iota(perm.begin(), perm.end(), std::int64_t{0});
    std::shuffle(perm.begin(), perm.end(), engine_);
    return perm;
}

std::shared_ptr<RandomState> get_seed(const SeedSpec& seed) {
    if (const auto* value = std::get_if<std::int64_t>(&seed)) {
        if (*value < 0 || *value > MAX_SEED) {
            throw std::invalid_argument("Seed must be between 0 and 2**32 - 1, got " +
                                        std::to_string(*value));
        }
        return std::make_shared<RandomState>(static_cast<std::uint32_t>(*value));
    }

    if (const auto* state = std::get_if<std::shared_ptr<RandomState>>(&seed)) {
        if (*state) {
            return *state;
        }
    }

    return default_random_state();
}

std::shared_ptr<RandomState> default_random_state() {
    return default_slot();
}

void set_default_random_state(std::shared_ptr<RandomState> state) {
    if (!state) {
        state = std::make_shared<RandomState>();
    }
    default_slot() = std::move(state);
}

}  // namespace pls::rng
