#pragma once

#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include <esg/equity.hpp>
#include <esg/interest.hpp>

namespace esg {

// Closed family of the models above; lets one Correlated group mix rate and equity paths.
class AnyModel {
public:
    using value_type = double;
    using variant_type = std::variant<Vasicek, CoxIngersollRoss, BlackScholesMerton, ConstantElasticityOfVariance>;

    template <typename M>
        requires std::is_constructible_v<variant_type, M>
    AnyModel(M model) : model_(std::move(model)) {}

    const variant_type& get() const noexcept { return model_; }

private:
    variant_type model_;
};

double initial_value(const AnyModel& model);
double initial_value(const AnyModel& model, double timestep);
double next_value(const AnyModel& model, double value, double time, double timestep, double variate);
void validate(const AnyModel& model);

std::string_view model_name(const AnyModel& model);

} // namespace esg
