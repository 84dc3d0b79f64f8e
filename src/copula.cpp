#include <esg/copula.hpp>

#include <esg/distributions.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <utility>

namespace esg {

namespace {

constexpr double kEpsilon = 1e-12;
constexpr double kCorrelationTolerance = 1e-10;

void validate_correlation(const Eigen::MatrixXd& correlation) {
    if (correlation.rows() == 0 || correlation.rows() != correlation.cols()) {
        throw std::invalid_argument("correlation matrix must be square and non-empty");
    }
    for (Eigen::Index i = 0; i < correlation.rows(); ++i) {
        if (std::abs(correlation(i, i) - 1.0) > kCorrelationTolerance) {
            throw std::invalid_argument("correlation matrix must have a unit diagonal");
        }
        for (Eigen::Index j = 0; j < i; ++j) {
            const double rho = correlation(i, j);
            if (!std::isfinite(rho) || std::abs(rho - correlation(j, i)) > kCorrelationTolerance) {
                throw std::invalid_argument("correlation matrix must be finite and symmetric");
            }
            if (std::abs(rho) > 1.0 + kCorrelationTolerance) {
                throw std::invalid_argument("correlation entries must lie in [-1, 1]");
            }
        }
    }
}

// Keeps variates strictly inside (0,1) when a CDF rounds to an endpoint.
double clamp_open(double u) {
    constexpr double lo = std::numeric_limits<double>::min();
    const double hi = std::nextafter(1.0, 0.0);
    return std::clamp(u, lo, hi);
}

} // namespace

Eigen::MatrixXd compute_cholesky(const Eigen::MatrixXd& correlation) {
    const Eigen::Index dim = correlation.rows();
    if (dim <= 0 || correlation.cols() != dim) {
        throw std::invalid_argument("correlation dimension must be positive and square");
    }

    Eigen::MatrixXd L = Eigen::MatrixXd::Zero(dim, dim);

    for (Eigen::Index i = 0; i < dim; ++i) {
        for (Eigen::Index j = 0; j <= i; ++j) {
            double sum = correlation(i, j);
            for (Eigen::Index k = 0; k < j; ++k) {
                sum -= L(i, k) * L(j, k);
            }
            if (i == j) {
                if (sum < -kEpsilon) {
                    throw std::invalid_argument("correlation matrix is not positive semi-definite");
                }
                L(i, j) = sum <= kEpsilon ? 0.0 : std::sqrt(sum);
            } else {
                const double diag = L(j, j);
                L(i, j) = std::abs(diag) <= kEpsilon ? 0.0 : sum / diag;
            }
        }
    }

    return L;
}

GaussianCopula::GaussianCopula(Eigen::MatrixXd correlation)
    : correlation_(std::move(correlation)) {
    validate_correlation(correlation_);
    cholesky_ = compute_cholesky(correlation_);
}

std::size_t GaussianCopula::dimension() const noexcept {
    return static_cast<std::size_t>(correlation_.rows());
}

Eigen::MatrixXd GaussianCopula::correlated_normals(RandomSource& rng, std::size_t count) const {
    const Eigen::Index dim = correlation_.rows();
    const Eigen::Index cols = static_cast<Eigen::Index>(count);

    std::normal_distribution<double> norm01(0.0, 1.0);
    Eigen::MatrixXd z(dim, cols);
    for (Eigen::Index r = 0; r < dim; ++r) {
        for (Eigen::Index c = 0; c < cols; ++c) {
            z(r, c) = norm01(rng);
        }
    }
    return cholesky_ * z;
}

Eigen::MatrixXd GaussianCopula::sample(RandomSource& rng, std::size_t count) const {
    Eigen::MatrixXd u = correlated_normals(rng, count);
    for (Eigen::Index r = 0; r < u.rows(); ++r) {
        for (Eigen::Index c = 0; c < u.cols(); ++c) {
            u(r, c) = clamp_open(normal_cdf(u(r, c)));
        }
    }
    return u;
}

StudentTCopula::StudentTCopula(Eigen::MatrixXd correlation, double degrees_of_freedom)
    : GaussianCopula(std::move(correlation)), dof_(degrees_of_freedom) {
    if (!(dof_ > 0.0) || !std::isfinite(dof_)) {
        throw std::invalid_argument("degrees of freedom must be positive and finite");
    }
}

Eigen::MatrixXd StudentTCopula::sample(RandomSource& rng, std::size_t count) const {
    Eigen::MatrixXd u = correlated_normals(rng, count);
    std::chi_squared_distribution<double> chi_squared(dof_);
    for (Eigen::Index c = 0; c < u.cols(); ++c) {
        const double scale = std::sqrt(dof_ / chi_squared(rng));
        for (Eigen::Index r = 0; r < u.rows(); ++r) {
            u(r, c) = clamp_open(student_t_cdf(u(r, c) * scale, dof_));
        }
    }
    return u;
}

IndependenceCopula::IndependenceCopula(std::size_t dimension)
    : dimension_(dimension) {
    if (dimension_ == 0) {
        throw std::invalid_argument("copula dimension must be positive");
    }
}

std::size_t IndependenceCopula::dimension() const noexcept {
    return dimension_;
}

Eigen::MatrixXd IndependenceCopula::sample(RandomSource& rng, std::size_t count) const {
    Eigen::MatrixXd u(static_cast<Eigen::Index>(dimension_), static_cast<Eigen::Index>(count));
    for (Eigen::Index r = 0; r < u.rows(); ++r) {
        for (Eigen::Index c = 0; c < u.cols(); ++c) {
            u(r, c) = uniform_variate(rng);
        }
    }
    return u;
}

} // namespace esg
