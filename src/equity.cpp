#include <esg/equity.hpp>

#include <esg/distributions.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace esg {

namespace {

void validate_equity(double rate, double dividend_yield, double sigma, double initial) {
    if (!std::isfinite(rate) || !std::isfinite(dividend_yield)) {
        throw std::invalid_argument("equity rate and dividend yield must be finite");
    }
    if (!(sigma >= 0.0) || !std::isfinite(sigma)) {
        throw std::invalid_argument("equity volatility must be non-negative");
    }
    if (!(initial > 0.0) || !std::isfinite(initial)) {
        throw std::invalid_argument("equity initial price must be positive");
    }
}

} // namespace

double initial_value(const BlackScholesMerton& model) {
    return model.initial;
}

double next_value(const BlackScholesMerton& model, double price, double /*time*/, double timestep, double variate) {
    const double shock = normal_quantile(variate);
    const double drift = (model.rate - model.dividend_yield - 0.5 * model.sigma * model.sigma) * timestep;
    return price * std::exp(drift + model.sigma * std::sqrt(timestep) * shock);
}

void validate(const BlackScholesMerton& model) {
    validate_equity(model.rate, model.dividend_yield, model.sigma, model.initial);
}

double initial_value(const ConstantElasticityOfVariance& model) {
    return model.initial;
}

double next_value(const ConstantElasticityOfVariance& model, double price, double /*time*/, double timestep, double variate) {
    const double shock = normal_quantile(variate);
    if (price <= 0.0) {
        return 0.0;
    }
    const double drift = (model.rate - model.dividend_yield) * price * timestep;
    const double diffusion = model.sigma * std::pow(price, model.gamma) * std::sqrt(timestep) * shock;
    return std::max(price + drift + diffusion, 0.0);
}

void validate(const ConstantElasticityOfVariance& model) {
    validate_equity(model.rate, model.dividend_yield, model.sigma, model.initial);
    if (!(model.gamma >= 0.0) || !std::isfinite(model.gamma)) {
        throw std::invalid_argument("CEV elasticity must be non-negative");
    }
}

boost::math::lognormal_distribution<double> price_distribution(const ScenarioGenerator<BlackScholesMerton>& generator) {
    const BlackScholesMerton& m = generator.model();
    const double horizon = generator.terminal_time();
    const double location = std::log(m.initial) + (m.rate - m.dividend_yield - 0.5 * m.sigma * m.sigma) * horizon;
    const double scale = m.sigma * std::sqrt(horizon);
    return boost::math::lognormal_distribution<double>(location, scale);
}

} // namespace esg
