#include <esg/any_model.hpp>

#include <esg/model.hpp>

#include <type_traits>

namespace esg {

double initial_value(const AnyModel& model) {
    return std::visit([](const auto& m) -> double { return initial_value(m); }, model.get());
}

double initial_value(const AnyModel& model, double timestep) {
    return std::visit([timestep](const auto& m) -> double { return initial_value(m, timestep); }, model.get());
}

double next_value(const AnyModel& model, double value, double time, double timestep, double variate) {
    return std::visit(
        [&](const auto& m) -> double { return next_value(m, value, time, timestep, variate); },
        model.get());
}

void validate(const AnyModel& model) {
    std::visit([](const auto& m) { validate(m); }, model.get());
}

std::string_view model_name(const AnyModel& model) {
    return std::visit(
        [](const auto& m) -> std::string_view {
            using M = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<M, Vasicek>) {
                return "Vasicek";
            } else if constexpr (std::is_same_v<M, CoxIngersollRoss>) {
                return "CoxIngersollRoss";
            } else if constexpr (std::is_same_v<M, BlackScholesMerton>) {
                return "BlackScholesMerton";
            } else {
                return "ConstantElasticityOfVariance";
            }
        },
        model.get());
}

} // namespace esg
