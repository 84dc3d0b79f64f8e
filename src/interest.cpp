#include <esg/interest.hpp>

#include <esg/distributions.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace esg {

namespace {

void validate_short_rate(double a, double sigma, double initial) {
    if (!std::isfinite(a) || !std::isfinite(initial)) {
        throw std::invalid_argument("short-rate parameters must be finite");
    }
    if (!(sigma >= 0.0) || !std::isfinite(sigma)) {
        throw std::invalid_argument("short-rate volatility must be non-negative");
    }
}

} // namespace

double initial_value(const Vasicek& model) {
    return model.initial;
}

double next_value(const Vasicek& model, double rate, double /*time*/, double timestep, double variate) {
    const double shock = normal_quantile(variate);
    return rate + model.a * (model.b - rate) * timestep + model.sigma * std::sqrt(timestep) * shock;
}

void validate(const Vasicek& model) {
    validate_short_rate(model.a, model.sigma, model.initial);
    if (!std::isfinite(model.b)) {
        throw std::invalid_argument("Vasicek long-run mean must be finite");
    }
}

double initial_value(const CoxIngersollRoss& model) {
    return model.initial;
}

double next_value(const CoxIngersollRoss& model, double rate, double /*time*/, double timestep, double variate) {
    const double shock = normal_quantile(variate);
    const double diffusion = model.sigma * std::sqrt(std::max(rate, 0.0) * timestep);
    return rate + model.a * (model.b - rate) * timestep + diffusion * shock;
}

void validate(const CoxIngersollRoss& model) {
    validate_short_rate(model.a, model.sigma, model.initial);
    if (!(model.b >= 0.0) || !std::isfinite(model.b)) {
        throw std::invalid_argument("CIR long-run mean must be non-negative");
    }
}

} // namespace esg
