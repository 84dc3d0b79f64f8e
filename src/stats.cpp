#include <esg/stats.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>

namespace esg {

namespace {
constexpr int kMaxSeriesTerms = 100;
constexpr double kSeriesTolerance = 1e-12;
}

double kolmogorov_survival(double lambda) {
    if (lambda <= 0.0) {
        return 1.0;
    }
    // The alternating series converges too slowly near zero; the CDF is ~0 there anyway.
    if (lambda < 0.2) {
        return 1.0;
    }
    double sum = 0.0;
    for (int k = 1; k <= kMaxSeriesTerms; ++k) {
        const double term = std::exp(-2.0 * k * k * lambda * lambda);
        sum += (k % 2 == 1 ? term : -term);
        if (term < kSeriesTolerance) {
            break;
        }
    }
    return std::clamp(2.0 * sum, 0.0, 1.0);
}

KsResult ks_test(std::vector<double> samples, const std::function<double(double)>& cdf) {
    if (samples.empty()) {
        throw std::invalid_argument("ks_test requires non-empty samples");
    }
    std::sort(samples.begin(), samples.end());

    const double n = static_cast<double>(samples.size());
    double d = 0.0;
    for (std::size_t i = 0; i < samples.size(); ++i) {
        const double f = cdf(samples[i]);
        const double above = static_cast<double>(i + 1) / n - f;
        const double below = f - static_cast<double>(i) / n;
        d = std::max({d, above, below});
    }

    const double sqrt_n = std::sqrt(n);
    KsResult result;
    result.statistic = d;
    result.p_value = kolmogorov_survival((sqrt_n + 0.12 + 0.11 / sqrt_n) * d);
    return result;
}

double sample_mean(const std::vector<double>& x) {
    if (x.empty()) {
        throw std::invalid_argument("sample_mean requires non-empty data");
    }
    double sum = 0.0;
    for (double v : x) {
        sum += v;
    }
    return sum / static_cast<double>(x.size());
}

std::vector<double> sample_quantiles(std::vector<double> samples, const std::vector<double>& levels) {
    if (samples.empty()) {
        throw std::invalid_argument("sample_quantiles requires non-empty samples");
    }
    std::sort(samples.begin(), samples.end());

    const double last = static_cast<double>(samples.size() - 1);
    std::vector<double> out;
    out.reserve(levels.size());
    for (double level : levels) {
        if (!(level >= 0.0 && level <= 1.0)) {
            throw std::invalid_argument("quantile level must lie in [0, 1]");
        }
        const double rank = level * last;
        const auto lo = static_cast<std::size_t>(std::floor(rank));
        const std::size_t hi = std::min(lo + 1, samples.size() - 1);
        const double weight = rank - static_cast<double>(lo);
        out.push_back(samples[lo] + weight * (samples[hi] - samples[lo]));
    }
    return out;
}

double sample_correlation(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.size() < 2) {
        throw std::invalid_argument("sample_correlation requires two samples of equal size >= 2");
    }
    const double mx = sample_mean(x);
    const double my = sample_mean(y);

    double sxy = 0.0;
    double sxx = 0.0;
    double syy = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        const double dx = x[i] - mx;
        const double dy = y[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (sxx <= 0.0 || syy <= 0.0) {
        throw std::invalid_argument("sample_correlation undefined for a constant sample");
    }
    return sxy / std::sqrt(sxx * syy);
}

} // namespace esg
