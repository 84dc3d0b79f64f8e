#include <esg/random.hpp>

namespace esg {

std::shared_ptr<RandomSource> make_random_source(std::uint64_t seed) {
    return std::make_shared<RandomSource>(seed);
}

std::shared_ptr<RandomSource> make_random_source() {
    std::random_device device;
    const std::uint64_t seed = (static_cast<std::uint64_t>(device()) << 32) | device();
    return make_random_source(seed);
}

double uniform_variate(RandomSource& rng) {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    double u = uniform(rng);
    while (u <= 0.0) {
        u = uniform(rng);
    }
    return u;
}

} // namespace esg
