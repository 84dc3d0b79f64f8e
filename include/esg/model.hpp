#pragma once

#include <concepts>

namespace esg {

// A stochastic process advanced one grid step at a time from a uniform variate.
// Models are immutable parameter sets; the functions below are found by ADL.
// Each built-in model also has an opt-in validate(model) that generators never call.
template <typename M>
concept EconomicModel = requires(const M& model, double value, double time, double timestep, double variate) {
    typename M::value_type;
    { initial_value(model) } -> std::convertible_to<typename M::value_type>;
    { next_value(model, value, time, timestep, variate) } -> std::convertible_to<typename M::value_type>;
};

template <EconomicModel M>
using output_t = typename M::value_type;

// Models whose first published value depends on the step size overload this.
template <EconomicModel M>
output_t<M> initial_value(const M& model, double /*timestep*/) {
    return initial_value(model);
}

} // namespace esg
