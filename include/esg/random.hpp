#pragma once

#include <cstdint>
#include <memory>
#include <random>

namespace esg {

using RandomSource = std::mt19937_64;

// Sources are shared by handle; every draw advances the shared state.
std::shared_ptr<RandomSource> make_random_source(std::uint64_t seed);
std::shared_ptr<RandomSource> make_random_source();

// Uniform draw on the open interval (0,1).
double uniform_variate(RandomSource& rng);

} // namespace esg
