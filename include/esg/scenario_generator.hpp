#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <esg/model.hpp>
#include <esg/random.hpp>
#include <esg/utils.hpp>

namespace esg {

// Lazy sequence of one model's values on the grid 0, timestep, ..., endtime; each step draws from the shared source.
template <EconomicModel Model>
class ScenarioGenerator {
public:
    using model_type = Model;
    using value_type = output_t<Model>;

    struct State {
        double time = 0.0;
        value_type value{};
        std::size_t step = 0; // grid index of time
    };

    using Step = std::optional<std::pair<value_type, State>>;

    class iterator;

    ScenarioGenerator(double timestep,
                      double endtime,
                      Model model,
                      std::shared_ptr<RandomSource> rng = make_random_source())
        : timestep_(timestep),
          endtime_(endtime),
          length_(grid_length(timestep, endtime)),
          model_(std::move(model)),
          rng_(std::move(rng)) {
        if (!rng_) {
            throw std::invalid_argument("random source must not be null");
        }
    }

    double timestep() const noexcept { return timestep_; }
    double endtime() const noexcept { return endtime_; }
    const Model& model() const noexcept { return model_; }
    const std::shared_ptr<RandomSource>& random_source() const noexcept { return rng_; }

    [[nodiscard]] std::size_t length() const noexcept { return length_; }

    double terminal_time() const noexcept { return timestep_ * static_cast<double>(length_ - 1); }

    Step start() const {
        State state{0.0, initial_value(model_, timestep_), 0};
        return std::make_pair(state.value, state);
    }

    // Terminal on the grid index, so long grids stay exactly length() values long.
    Step next(const State& state) const {
        if (state.step + 1 >= length_) {
            return std::nullopt;
        }
        const std::size_t step = state.step + 1;
        const double variate = uniform_variate(*rng_);
        State advanced{timestep_ * static_cast<double>(step),
                       next_value(model_, state.value, state.time, timestep_, variate),
                       step};
        return std::make_pair(advanced.value, advanced);
    }

    // Zero-based. Runs a fresh traversal every call, so repeated calls with the same
    // index consume new draws and generally return different values.
    value_type element_at(std::size_t index) const {
        if (index >= length_) {
            throw std::out_of_range("element_at index " + std::to_string(index) +
                                    " out of range for length " + std::to_string(length_));
        }
        Step step = start();
        for (std::size_t i = 0; i < index; ++i) {
            step = next(step->second);
            if (!step) {
                throw std::logic_error("traversal ended before element " + std::to_string(index));
            }
        }
        return step->first;
    }

    std::vector<value_type> collect() const {
        std::vector<value_type> values;
        values.reserve(length_);
        for (Step step = start(); step; step = next(step->second)) {
            values.push_back(step->first);
        }
        return values;
    }

    iterator begin() const { return iterator(this); }
    std::default_sentinel_t end() const noexcept { return std::default_sentinel; }

private:
    double timestep_;
    double endtime_;
    std::size_t length_;
    Model model_;
    std::shared_ptr<RandomSource> rng_;
};

template <EconomicModel Model>
class ScenarioGenerator<Model>::iterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = typename ScenarioGenerator<Model>::value_type;
    using difference_type = std::ptrdiff_t;

    iterator() = default;

    explicit iterator(const ScenarioGenerator* generator)
        : generator_(generator), step_(generator->start()) {}

    const value_type& operator*() const { return step_->first; }

    iterator& operator++() {
        step_ = generator_->next(step_->second);
        return *this;
    }

    void operator++(int) { ++*this; }

    friend bool operator==(const iterator& it, std::default_sentinel_t) noexcept {
        return !it.step_.has_value();
    }

private:
    const ScenarioGenerator* generator_ = nullptr;
    Step step_;
};

} // namespace esg
