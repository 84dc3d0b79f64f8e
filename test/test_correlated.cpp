#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <Eigen/Dense>

#include <esg/any_model.hpp>
#include <esg/copula.hpp>
#include <esg/correlated.hpp>
#include <esg/equity.hpp>
#include <esg/interest.hpp>
#include <esg/random.hpp>
#include <esg/scenario_generator.hpp>
#include <esg/stats.hpp>

#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>

using Catch::Approx;

namespace clock_model {

// Publishes the time it is stepped from.
struct Clock {
    using value_type = double;
};

double initial_value(const Clock&) {
    return -1.0;
}

double next_value(const Clock&, double, double time, double, double) {
    return time;
}

} // namespace clock_model

namespace {

using Generator = esg::ScenarioGenerator<esg::BlackScholesMerton>;

const esg::BlackScholesMerton kBsm{.rate = 0.01, .dividend_yield = 0.02, .sigma = 0.15, .initial = 100.0};

std::shared_ptr<const esg::Copula> gaussian(double rho) {
    Eigen::MatrixXd corr = Eigen::MatrixXd::Identity(2, 2);
    corr(0, 1) = rho;
    corr(1, 0) = rho;
    return std::make_shared<esg::GaussianCopula>(corr);
}

} // namespace

TEST_CASE("Correlated yields one full path per generator") {
    const Generator s(1.0, 30.0, kBsm, esg::make_random_source(1));
    const esg::Correlated<esg::BlackScholesMerton> c({s, s}, gaussian(0.9), esg::make_random_source(2));

    REQUIRE(c.length() == 2);
    REQUIRE(c.steps() == 30);

    std::size_t count = 0;
    for (const auto& path : c) {
        REQUIRE(path.size() == 30);
        ++count;
    }
    REQUIRE(count == 2);
}

TEST_CASE("Correlated rejects generators on different grids") {
    const Generator annual(1.0, 30.0, kBsm);
    const Generator semiannual(0.5, 30.0, kBsm);
    const Generator shorter(1.0, 20.0, kBsm);

    using Group = esg::Correlated<esg::BlackScholesMerton>;
    REQUIRE_THROWS_AS(Group({annual, semiannual}, gaussian(0.5)), std::invalid_argument);
    REQUIRE_THROWS_AS(Group({annual, shorter}, gaussian(0.5)), std::invalid_argument);
}

TEST_CASE("Correlated rejects an empty group or a mismatched copula") {
    const Generator s(1.0, 5.0, kBsm);
    using Group = esg::Correlated<esg::BlackScholesMerton>;

    REQUIRE_THROWS_AS(Group({}, gaussian(0.5)), std::invalid_argument);
    REQUIRE_THROWS_AS(Group({s, s}, nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(Group({s, s, s}, gaussian(0.5)), std::invalid_argument);
}

TEST_CASE("Correlated samples the variate matrix once per traversal") {
    const Generator s(1.0, 5.0, kBsm);
    const esg::Correlated<esg::BlackScholesMerton> c({s, s, s},
                                                     std::make_shared<esg::IndependenceCopula>(3),
                                                     esg::make_random_source(6));

    auto step = c.start();
    REQUIRE(step.has_value());
    const auto variates = step->second.variates;
    REQUIRE(variates->rows() == 3);
    REQUIRE(variates->cols() == 5);
    REQUIRE(step->second.n == 1);

    step = c.next(step->second);
    REQUIRE(step.has_value());
    REQUIRE(step->second.variates == variates);

    step = c.next(step->second);
    REQUIRE(step.has_value());
    REQUIRE(step->second.n == 3);
    REQUIRE_FALSE(c.next(step->second).has_value());
}

TEST_CASE("Correlated rejects a state that did not come from start") {
    const Generator s(1.0, 5.0, kBsm);
    const esg::Correlated<esg::BlackScholesMerton> c({s, s}, gaussian(0.5), esg::make_random_source(6));

    REQUIRE_THROWS_AS(c.next(esg::Correlated<esg::BlackScholesMerton>::State{}), std::invalid_argument);
}

TEST_CASE("paths step models from the same times as a standalone traversal") {
    const esg::ScenarioGenerator<clock_model::Clock> s(0.5, 2.0, clock_model::Clock{}, esg::make_random_source(1));
    const esg::Correlated<clock_model::Clock> c({s}, std::make_shared<esg::IndependenceCopula>(1),
                                                esg::make_random_source(2));

    const auto standalone = s.collect();
    const auto paths = c.collect();
    REQUIRE(standalone == std::vector<double>{-1.0, 0.0, 0.5, 1.0, 1.5});
    REQUIRE(paths.size() == 1);
    REQUIRE(paths.front() == std::vector<double>(standalone.begin() + 1, standalone.end()));
}

TEST_CASE("each path replays its model over its row of variates") {
    const Generator s(0.5, 3.0, kBsm);
    const auto copula = std::make_shared<esg::IndependenceCopula>(2);
    const esg::Correlated<esg::BlackScholesMerton> c({s, s}, copula, esg::make_random_source(31));

    auto replay_rng = esg::make_random_source(31);
    const Eigen::MatrixXd variates = copula->sample(*replay_rng, 6);

    const auto paths = c.collect();
    REQUIRE(paths.size() == 2);
    for (Eigen::Index n = 0; n < 2; ++n) {
        double value = kBsm.initial;
        for (Eigen::Index k = 0; k < 6; ++k) {
            value = esg::next_value(kBsm, value, 0.5 * static_cast<double>(k), 0.5, variates(n, k));
            REQUIRE(paths[static_cast<std::size_t>(n)][static_cast<std::size_t>(k)] == Approx(value).epsilon(1e-14));
        }
    }
}

TEST_CASE("Correlated leaves the generators' own random sources untouched") {
    const auto own = esg::make_random_source(12);
    const Generator s(1.0, 10.0, kBsm, own);
    const esg::Correlated<esg::BlackScholesMerton> c({s, s}, gaussian(0.3), esg::make_random_source(13));

    c.collect();
    REQUIRE(*own == esg::RandomSource(12));
}

TEST_CASE("perfectly correlated identical generators produce identical paths") {
    const Generator s(1.0, 10.0, kBsm);
    const esg::Correlated<esg::BlackScholesMerton> c({s, s}, gaussian(1.0), esg::make_random_source(17));

    const auto paths = c.collect();
    REQUIRE(paths[0].size() == paths[1].size());
    for (std::size_t k = 0; k < paths[0].size(); ++k) {
        REQUIRE(paths[0][k] == Approx(paths[1][k]).epsilon(1e-12));
    }
}

TEST_CASE("terminal log prices inherit the copula correlation") {
    const Generator s(1.0, 10.0, kBsm);
    const esg::Correlated<esg::BlackScholesMerton> c({s, s}, gaussian(0.9), esg::make_random_source(23));

    std::vector<double> first;
    std::vector<double> second;
    for (int i = 0; i < 2000; ++i) {
        const auto paths = c.collect();
        first.push_back(std::log(paths[0].back()));
        second.push_back(std::log(paths[1].back()));
    }
    REQUIRE(esg::sample_correlation(first, second) == Approx(0.9).margin(0.03));
}

TEST_CASE("identically seeded Correlated groups are reproducible") {
    const Generator s(1.0, 30.0, kBsm);
    const esg::Correlated<esg::BlackScholesMerton> a({s, s}, gaussian(0.4), esg::make_random_source(5));
    const esg::Correlated<esg::BlackScholesMerton> b({s, s}, gaussian(0.4), esg::make_random_source(5));

    REQUIRE(a.collect() == b.collect());
}

TEST_CASE("Correlated can mix rate and equity models") {
    using AnyGenerator = esg::ScenarioGenerator<esg::AnyModel>;
    const AnyGenerator rates(1.0, 30.0, esg::Vasicek{.a = 0.136, .b = 0.0168, .sigma = 0.0119, .initial = 0.01});
    const AnyGenerator equity(1.0, 30.0, kBsm);
    const esg::Correlated<esg::AnyModel> c({rates, equity}, gaussian(-0.5), esg::make_random_source(3));

    const auto paths = c.collect();
    REQUIRE(paths.size() == 2);
    REQUIRE(paths[0].size() == 30);
    REQUIRE(std::abs(paths[0].front() - 0.01) < 0.1);
    REQUIRE(paths[1].front() > 50.0);
}

TEST_CASE("a zero horizon gives empty paths") {
    const Generator s(1.0, 0.0, kBsm);
    const esg::Correlated<esg::BlackScholesMerton> c({s, s}, gaussian(0.5), esg::make_random_source(1));

    REQUIRE(c.steps() == 0);
    const auto paths = c.collect();
    REQUIRE(paths.size() == 2);
    REQUIRE(paths[0].empty());
    REQUIRE(paths[1].empty());
}
