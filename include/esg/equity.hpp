#pragma once

#include <boost/math/distributions/lognormal.hpp>

#include <esg/scenario_generator.hpp>

namespace esg {

// dS/S = (r - q)dt + sigma dW, simulated with the exact log-normal transition.
struct BlackScholesMerton {
    using value_type = double;

    double rate = 0.0;           // risk-free rate
    double dividend_yield = 0.0; // dividend or borrow yield
    double sigma = 0.0;
    double initial = 0.0;        // spot price at t=0
};

// dS = (r - q)S dt + sigma S^gamma dW, Euler step absorbed at zero.
struct ConstantElasticityOfVariance {
    using value_type = double;

    double rate = 0.0;
    double dividend_yield = 0.0;
    double sigma = 0.0;
    double gamma = 1.0;
    double initial = 0.0;
};

double initial_value(const BlackScholesMerton& model);
double next_value(const BlackScholesMerton& model, double price, double time, double timestep, double variate);
void validate(const BlackScholesMerton& model);

double initial_value(const ConstantElasticityOfVariance& model);
double next_value(const ConstantElasticityOfVariance& model, double price, double time, double timestep, double variate);
void validate(const ConstantElasticityOfVariance& model);

// Closed-form law of the last price the generator emits.
boost::math::lognormal_distribution<double> price_distribution(const ScenarioGenerator<BlackScholesMerton>& generator);

} // namespace esg
