#pragma once

#include <cstddef>

namespace esg {

// Relative comparison at sqrt(machine epsilon); identical values always compare equal.
[[nodiscard]] bool approx_equal(double x, double y) noexcept;

// Number of grid points in [0, endtime] stepped by timestep, endpoints included.
[[nodiscard]] std::size_t grid_length(double timestep, double endtime);

// Grid points after t=0.
[[nodiscard]] std::size_t grid_steps(double timestep, double endtime);

} // namespace esg
