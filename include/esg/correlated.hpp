#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include <spdlog/spdlog.h>

#include <esg/copula.hpp>
#include <esg/model.hpp>
#include <esg/random.hpp>
#include <esg/scenario_generator.hpp>
#include <esg/utils.hpp>

namespace esg {

// Couples generators on a common grid through a copula: one variate matrix per traversal, one path per pull.
template <EconomicModel Model>
class Correlated {
public:
    using generator_type = ScenarioGenerator<Model>;
    using path_type = std::vector<output_t<Model>>;
    using value_type = path_type;

    struct State {
        std::shared_ptr<const Eigen::MatrixXd> variates;
        std::size_t n = 0;
    };

    using Step = std::optional<std::pair<path_type, State>>;

    class iterator;

    Correlated(std::vector<generator_type> generators,
               std::shared_ptr<const Copula> copula,
               std::shared_ptr<RandomSource> rng = make_random_source())
        : generators_(std::move(generators)),
          copula_(std::move(copula)),
          rng_(std::move(rng)) {
        if (generators_.empty()) {
            throw std::invalid_argument("Correlated requires at least one generator");
        }
        const generator_type& first = generators_.front();
        for (const generator_type& g : generators_) {
            if (g.timestep() != first.timestep()) {
                throw std::invalid_argument("All component generators must have the same timestep");
            }
            if (g.endtime() != first.endtime()) {
                throw std::invalid_argument("All component generators must have the same endtime");
            }
        }
        if (!copula_) {
            throw std::invalid_argument("Correlated requires a copula");
        }
        if (copula_->dimension() != generators_.size()) {
            throw std::invalid_argument("copula dimension must equal the number of generators");
        }
        if (!rng_) {
            throw std::invalid_argument("random source must not be null");
        }
        spdlog::debug("Correlated group of {} generators over {} steps", generators_.size(), steps());
    }

    const std::vector<generator_type>& generators() const noexcept { return generators_; }
    const Copula& copula() const noexcept { return *copula_; }

    [[nodiscard]] std::size_t length() const noexcept { return generators_.size(); }

    std::size_t steps() const {
        const generator_type& first = generators_.front();
        return grid_steps(first.timestep(), first.endtime());
    }

    Step start() const {
        std::shared_ptr<const Eigen::MatrixXd> variates =
            std::make_shared<Eigen::MatrixXd>(copula_->sample(*rng_, steps()));
        spdlog::debug("Sampled {}x{} joint variates", variates->rows(), variates->cols());
        return emit(State{std::move(variates), 0});
    }

    Step next(const State& state) const {
        if (!state.variates) {
            throw std::invalid_argument("Correlated state has no variates; traversals begin with start()");
        }
        if (state.n >= generators_.size()) {
            return std::nullopt;
        }
        return emit(state);
    }

    std::vector<path_type> collect() const {
        std::vector<path_type> paths;
        paths.reserve(length());
        for (Step step = start(); step; step = next(step->second)) {
            paths.push_back(std::move(step->first));
        }
        return paths;
    }

    iterator begin() const { return iterator(this); }
    std::default_sentinel_t end() const noexcept { return std::default_sentinel; }

private:
    Step emit(const State& state) const {
        path_type values = path(state.n, *state.variates);
        return std::make_pair(std::move(values), State{state.variates, state.n + 1});
    }

    path_type path(std::size_t n, const Eigen::MatrixXd& variates) const {
        const generator_type& g = generators_[n];
        const Eigen::Index row = static_cast<Eigen::Index>(n);
        const std::size_t count = static_cast<std::size_t>(variates.cols());

        path_type values;
        values.reserve(count);
        auto value = initial_value(g.model(), g.timestep());
        for (std::size_t k = 0; k < count; ++k) {
            // Pre-step time, as ScenarioGenerator::next passes it.
            const double time = g.timestep() * static_cast<double>(k);
            value = next_value(g.model(), value, time, g.timestep(), variates(row, static_cast<Eigen::Index>(k)));
            values.push_back(value);
        }
        return values;
    }

    std::vector<generator_type> generators_;
    std::shared_ptr<const Copula> copula_;
    std::shared_ptr<RandomSource> rng_;
};

template <EconomicModel Model>
class Correlated<Model>::iterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = typename Correlated<Model>::path_type;
    using difference_type = std::ptrdiff_t;

    iterator() = default;

    explicit iterator(const Correlated* correlated)
        : correlated_(correlated), step_(correlated->start()) {}

    const value_type& operator*() const { return step_->first; }

    iterator& operator++() {
        step_ = correlated_->next(step_->second);
        return *this;
    }

    void operator++(int) { ++*this; }

    friend bool operator==(const iterator& it, std::default_sentinel_t) noexcept {
        return !it.step_.has_value();
    }

private:
    const Correlated* correlated_ = nullptr;
    Step step_;
};

} // namespace esg
