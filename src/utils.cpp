#include <esg/utils.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace esg {

namespace {
const double kRelativeTolerance = std::sqrt(std::numeric_limits<double>::epsilon());
}

bool approx_equal(double x, double y) noexcept {
    if (x == y) {
        return true;
    }
    if (!std::isfinite(x) || !std::isfinite(y)) {
        return false;
    }
    return std::abs(x - y) <= kRelativeTolerance * std::max(std::abs(x), std::abs(y));
}

std::size_t grid_length(double timestep, double endtime) {
    if (!(timestep > 0.0) || !std::isfinite(timestep)) {
        throw std::invalid_argument("timestep must be positive and finite");
    }
    if (!(endtime >= 0.0) || !std::isfinite(endtime)) {
        throw std::invalid_argument("endtime must be non-negative and finite");
    }

    const double ratio = endtime / timestep;
    const double nearest = std::round(ratio);
    const double steps = approx_equal(ratio, nearest) ? nearest : std::floor(ratio);
    return static_cast<std::size_t>(steps) + 1;
}

std::size_t grid_steps(double timestep, double endtime) {
    return grid_length(timestep, endtime) - 1;
}

} // namespace esg
