#pragma once

namespace esg {

// dr = a(b - r)dt + sigma dW
struct Vasicek {
    using value_type = double;

    double a = 0.0;      // mean-reversion speed
    double b = 0.0;      // long-run mean
    double sigma = 0.0;
    double initial = 0.0; // continuously compounded short rate at t=0
};

// dr = a(b - r)dt + sigma sqrt(r) dW
struct CoxIngersollRoss {
    using value_type = double;

    double a = 0.0;
    double b = 0.0;
    double sigma = 0.0;
    double initial = 0.0;
};

double initial_value(const Vasicek& model);
double next_value(const Vasicek& model, double rate, double time, double timestep, double variate);
void validate(const Vasicek& model);

double initial_value(const CoxIngersollRoss& model);
// Full truncation: a negative rate contributes no diffusion.
double next_value(const CoxIngersollRoss& model, double rate, double time, double timestep, double variate);
void validate(const CoxIngersollRoss& model);

} // namespace esg
