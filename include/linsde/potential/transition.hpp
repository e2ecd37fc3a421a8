#pragma once

#include "linsde/matrix/matrix.hpp"
#include "linsde/potential/gaussian.hpp"

namespace linsde::potential {

/// Linear Gaussian transition kernel x_t = A x_s + u + e, e ~ N(0, Sigma).
/// Sigma is re-tagged PSD on construction.
class GaussianTransition {
public:
    GaussianTransition(matrix::Matrix A, matrix::VectorBatch u, matrix::Matrix Sigma);

    /// A = I, u = 0, Sigma = 0.
    [[nodiscard]] static GaussianTransition identity(Eigen::Index dim);

    [[nodiscard]] const matrix::Matrix& A() const { return A_; }
    [[nodiscard]] const matrix::VectorBatch& u() const { return u_; }
    [[nodiscard]] const matrix::Matrix& Sigma() const { return Sigma_; }

    [[nodiscard]] Eigen::Index dim() const { return A_.rows(); }
    [[nodiscard]] matrix::BatchSize batch_size() const { return batch_size_; }

    /// p(x_t | x_s = x).
    [[nodiscard]] StandardGaussian condition_on_x(const matrix::VectorBatch& x) const;

    /// p(x_t) = integral of p(x_t | x_s) p(x_s) over x_s.
    [[nodiscard]] StandardGaussian marginalize_out_x(const StandardGaussian& prior) const;

    /// Compose with the kernel that follows this one: (s -> tau) then (tau -> t).
    [[nodiscard]] GaussianTransition chain(const GaussianTransition& next) const;

    /// Multiply the kernel by a potential on x_t and renormalize over x_t.
    [[nodiscard]] GaussianTransition update_y(const NaturalGaussian& message) const;

    /// Pull a potential on x_t back to a potential on x_s.
    [[nodiscard]] NaturalGaussian backward_message(const NaturalGaussian& message) const;

    struct Reversed;

    /// Bayesian inversion of the kernel given a prior on x_s.
    [[nodiscard]] Reversed swap(const StandardGaussian& prior) const;

private:
    matrix::Matrix A_;
    matrix::VectorBatch u_;
    matrix::Matrix Sigma_;
    matrix::BatchSize batch_size_;
};

struct GaussianTransition::Reversed {
    GaussianTransition transition;  // p(x_s | x_t)
    StandardGaussian marginal;      // p(x_t)
};

} // namespace linsde::potential
