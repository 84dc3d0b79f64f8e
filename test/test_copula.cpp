#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <Eigen/Dense>

#include <esg/copula.hpp>
#include <esg/distributions.hpp>
#include <esg/random.hpp>
#include <esg/stats.hpp>

#include <cmath>
#include <stdexcept>
#include <vector>

using Catch::Approx;

namespace {

Eigen::MatrixXd pair_correlation(double rho) {
    Eigen::MatrixXd corr = Eigen::MatrixXd::Identity(2, 2);
    corr(0, 1) = rho;
    corr(1, 0) = rho;
    return corr;
}

std::vector<double> normal_scores(const Eigen::MatrixXd& u, Eigen::Index row) {
    std::vector<double> scores;
    scores.reserve(static_cast<std::size_t>(u.cols()));
    for (Eigen::Index c = 0; c < u.cols(); ++c) {
        scores.push_back(esg::normal_quantile(u(row, c)));
    }
    return scores;
}

bool all_open_unit(const Eigen::MatrixXd& u) {
    return (u.array() > 0.0).all() && (u.array() < 1.0).all();
}

} // namespace

TEST_CASE("compute_cholesky factors a correlation matrix") {
    const Eigen::MatrixXd L = esg::compute_cholesky(pair_correlation(0.5));

    REQUIRE(L(0, 0) == Approx(1.0));
    REQUIRE(L(0, 1) == Approx(0.0));
    REQUIRE(L(1, 0) == Approx(0.5));
    REQUIRE(L(1, 1) == Approx(std::sqrt(0.75)));
}

TEST_CASE("compute_cholesky accepts a singular but semi-definite matrix") {
    const Eigen::MatrixXd L = esg::compute_cholesky(pair_correlation(1.0));

    REQUIRE(L(1, 0) == Approx(1.0));
    REQUIRE(L(1, 1) == Approx(0.0).margin(1e-12));
}

TEST_CASE("GaussianCopula rejects malformed correlation matrices") {
    Eigen::MatrixXd asymmetric = pair_correlation(0.5);
    asymmetric(0, 1) = 0.4;
    REQUIRE_THROWS_AS(esg::GaussianCopula(asymmetric), std::invalid_argument);

    Eigen::MatrixXd off_diagonal = pair_correlation(0.5);
    off_diagonal(1, 1) = 2.0;
    REQUIRE_THROWS_AS(esg::GaussianCopula(off_diagonal), std::invalid_argument);

    REQUIRE_THROWS_AS(esg::GaussianCopula(pair_correlation(1.5)), std::invalid_argument);
    REQUIRE_THROWS_AS(esg::GaussianCopula(Eigen::MatrixXd::Identity(2, 3)), std::invalid_argument);

    Eigen::MatrixXd indefinite(3, 3);
    indefinite << 1.0, 0.9, 0.9,
                  0.9, 1.0, -0.9,
                  0.9, -0.9, 1.0;
    REQUIRE_THROWS_AS(esg::GaussianCopula(indefinite), std::invalid_argument);
}

TEST_CASE("GaussianCopula samples one joint draw per column") {
    const esg::GaussianCopula copula(pair_correlation(0.9));
    auto rng = esg::make_random_source(8);

    const Eigen::MatrixXd u = copula.sample(*rng, 20'000);
    REQUIRE(copula.dimension() == 2);
    REQUIRE(u.rows() == 2);
    REQUIRE(u.cols() == 20'000);
    REQUIRE(all_open_unit(u));

    const double rho = esg::sample_correlation(normal_scores(u, 0), normal_scores(u, 1));
    REQUIRE(rho == Approx(0.9).margin(0.02));
}

TEST_CASE("copula samples are reproducible from the seed") {
    const esg::GaussianCopula copula(pair_correlation(-0.3));
    auto a = esg::make_random_source(99);
    auto b = esg::make_random_source(99);

    REQUIRE(copula.sample(*a, 50).isApprox(copula.sample(*b, 50), 0.0));
}

TEST_CASE("StudentTCopula keeps the correlation structure") {
    const esg::StudentTCopula copula(pair_correlation(0.9), 4.0);
    auto rng = esg::make_random_source(21);

    const Eigen::MatrixXd u = copula.sample(*rng, 20'000);
    REQUIRE(u.rows() == 2);
    REQUIRE(all_open_unit(u));
    REQUIRE(copula.degrees_of_freedom() == 4.0);

    const double rho = esg::sample_correlation(normal_scores(u, 0), normal_scores(u, 1));
    REQUIRE(rho > 0.8);
    REQUIRE(rho < 0.95);
}

TEST_CASE("StudentTCopula rejects non-positive degrees of freedom") {
    REQUIRE_THROWS_AS(esg::StudentTCopula(pair_correlation(0.2), 0.0), std::invalid_argument);
}

TEST_CASE("IndependenceCopula draws uncorrelated uniforms") {
    const esg::IndependenceCopula copula(3);
    auto rng = esg::make_random_source(4);

    const Eigen::MatrixXd u = copula.sample(*rng, 20'000);
    REQUIRE(u.rows() == 3);
    REQUIRE(all_open_unit(u));

    const double rho = esg::sample_correlation(normal_scores(u, 0), normal_scores(u, 2));
    REQUIRE(rho == Approx(0.0).margin(0.04));

    REQUIRE_THROWS_AS(esg::IndependenceCopula(0), std::invalid_argument);
}
