#pragma once

#include <functional>
#include <vector>

namespace esg {

struct KsResult {
    double statistic = 0.0; // sup |F_n - F|
    double p_value = 1.0;
};

// One-sample Kolmogorov-Smirnov test against a continuous CDF.
// The p-value uses the asymptotic Kolmogorov law with Stephens' correction for n.
KsResult ks_test(std::vector<double> samples, const std::function<double(double)>& cdf);

// Survival function of the Kolmogorov distribution, P(K > lambda).
double kolmogorov_survival(double lambda);

double sample_mean(const std::vector<double>& x);

// Quantiles at each level in [0, 1], interpolating linearly between order statistics.
std::vector<double> sample_quantiles(std::vector<double> samples, const std::vector<double>& levels);

// Pearson correlation of two equally sized samples.
double sample_correlation(const std::vector<double>& x, const std::vector<double>& y);

} // namespace esg
