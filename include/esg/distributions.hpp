#pragma once

namespace esg {

// Standard-normal inverse CDF; throws std::domain_error outside (0,1).
double normal_quantile(double variate);

double normal_cdf(double x);

double student_t_cdf(double x, double degrees_of_freedom);

} // namespace esg
