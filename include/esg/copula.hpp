#pragma once

#include <cstddef>

#include <Eigen/Dense>

#include <esg/random.hpp>

namespace esg {

// Joint law on (0,1)^d with uniform marginals.
class Copula {
public:
    virtual ~Copula() = default;

    virtual std::size_t dimension() const noexcept = 0;

    // dimension() x count; each column is one joint sample.
    virtual Eigen::MatrixXd sample(RandomSource& rng, std::size_t count) const = 0;
};

class GaussianCopula : public Copula {
public:
    explicit GaussianCopula(Eigen::MatrixXd correlation);

    std::size_t dimension() const noexcept override;
    Eigen::MatrixXd sample(RandomSource& rng, std::size_t count) const override;

    const Eigen::MatrixXd& correlation() const noexcept { return correlation_; }

protected:
    // Correlated standard normals, drawn generator-major then time-minor before mixing.
    Eigen::MatrixXd correlated_normals(RandomSource& rng, std::size_t count) const;

private:
    Eigen::MatrixXd correlation_;
    Eigen::MatrixXd cholesky_;
};

class StudentTCopula : public GaussianCopula {
public:
    StudentTCopula(Eigen::MatrixXd correlation, double degrees_of_freedom);

    Eigen::MatrixXd sample(RandomSource& rng, std::size_t count) const override;

    double degrees_of_freedom() const noexcept { return dof_; }

private:
    double dof_;
};

class IndependenceCopula : public Copula {
public:
    explicit IndependenceCopula(std::size_t dimension);

    std::size_t dimension() const noexcept override;
    Eigen::MatrixXd sample(RandomSource& rng, std::size_t count) const override;

private:
    std::size_t dimension_;
};

// Lower-triangular factor of a positive semi-definite correlation matrix.
Eigen::MatrixXd compute_cholesky(const Eigen::MatrixXd& correlation);

} // namespace esg
