#pragma once

#include "linsde/matrix/matrix.hpp"
#include <Eigen/Dense>

namespace linsde::potential {

class MixedGaussian;
class NaturalGaussian;

/// Gaussian in moment form: mean and covariance.
class StandardGaussian {
public:
    StandardGaussian(matrix::VectorBatch mu, matrix::Matrix Sigma);

    [[nodiscard]] const matrix::VectorBatch& mu() const { return mu_; }
    [[nodiscard]] const matrix::Matrix& Sigma() const { return Sigma_; }

    [[nodiscard]] Eigen::Index dim() const { return Sigma_.rows(); }
    [[nodiscard]] matrix::BatchSize batch_size() const { return batch_size_; }

    [[nodiscard]] MixedGaussian to_mixed() const;
    [[nodiscard]] NaturalGaussian to_natural() const;

    /// Log density at x, one value per batch item.
    [[nodiscard]] matrix::Batch<double> log_prob(const matrix::VectorBatch& x) const;

private:
    matrix::VectorBatch mu_;
    matrix::Matrix Sigma_;
    matrix::BatchSize batch_size_;
};

/// Gaussian parameterized by a point estimate and a precision matrix.
/// This is the form observation evidence is given in.
class MixedGaussian {
public:
    MixedGaussian(matrix::VectorBatch mu, matrix::Matrix J);

    [[nodiscard]] const matrix::VectorBatch& mu() const { return mu_; }
    [[nodiscard]] const matrix::Matrix& J() const { return J_; }

    [[nodiscard]] Eigen::Index dim() const { return J_.rows(); }
    [[nodiscard]] matrix::BatchSize batch_size() const { return batch_size_; }

    [[nodiscard]] StandardGaussian to_standard() const;
    [[nodiscard]] NaturalGaussian to_natural() const;

private:
    matrix::VectorBatch mu_;
    matrix::Matrix J_;
    matrix::BatchSize batch_size_;
};

/// Product of two potentials: precisions add, means combine precision-weighted.
MixedGaussian operator*(const MixedGaussian& a, const MixedGaussian& b);

/// Gaussian potential in information form exp(-x^T J x / 2 + h^T x).
/// J may be singular, so a NaturalGaussian can carry partial or no information.
class NaturalGaussian {
public:
    NaturalGaussian(matrix::Matrix J, matrix::VectorBatch h);

    /// Potential carrying no information (J = 0, h = 0).
    [[nodiscard]] static NaturalGaussian zeros(Eigen::Index dim);

    [[nodiscard]] const matrix::Matrix& J() const { return J_; }
    [[nodiscard]] const matrix::VectorBatch& h() const { return h_; }

    [[nodiscard]] Eigen::Index dim() const { return J_.rows(); }
    [[nodiscard]] matrix::BatchSize batch_size() const { return batch_size_; }

    /// Requires J to be invertible.
    [[nodiscard]] StandardGaussian to_standard() const;
    [[nodiscard]] MixedGaussian to_mixed() const;

private:
    matrix::Matrix J_;
    matrix::VectorBatch h_;
    matrix::BatchSize batch_size_;
};

/// Product of two potentials.
NaturalGaussian operator+(const NaturalGaussian& a, const NaturalGaussian& b);

} // namespace linsde::potential
