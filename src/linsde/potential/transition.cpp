#include "linsde/potential/transition.hpp"
#include <fmt/format.h>

namespace linsde::potential {

using matrix::Matrix;
using matrix::Tags;
using matrix::VectorBatch;

GaussianTransition::GaussianTransition(Matrix A, VectorBatch u, Matrix Sigma)
    : A_(std::move(A)), u_(std::move(u)), Sigma_(Sigma.with_tags(Tags::psd())) {
    const Eigen::Index n = A_.rows();
    if (A_.cols() != n || Sigma_.rows() != n || Sigma_.cols() != n) {
        throw ShapeMismatchError(fmt::format(
            "GaussianTransition: A is {}x{} but Sigma is {}x{}", A_.rows(), A_.cols(), Sigma_.rows(), Sigma_.cols()));
    }
    for (const auto& x : u_.items()) {
        if (x.size() != n) {
            throw ShapeMismatchError(fmt::format(
                "GaussianTransition: offset of length {} does not match dimension {}", x.size(), n));
        }
    }
    batch_size_ = matrix::common_batch_size(
        {A_.batch_size(), u_.batch_size(), Sigma_.batch_size()}, "GaussianTransition");
}

GaussianTransition GaussianTransition::identity(Eigen::Index dim) {
    return GaussianTransition(Matrix::eye(dim), matrix::zero_vector(dim), Matrix::zeros(dim));
}

StandardGaussian GaussianTransition::condition_on_x(const VectorBatch& x) const {
    return StandardGaussian(A_ * x + u_, Sigma_);
}

StandardGaussian GaussianTransition::marginalize_out_x(const StandardGaussian& prior) const {
    const Matrix cov = A_ * prior.Sigma() * A_.transpose() + Sigma_;
    return StandardGaussian(A_ * prior.mu() + u_, cov.symmetrized(Tags::psd()));
}

GaussianTransition GaussianTransition::chain(const GaussianTransition& next) const {
    const Matrix& A2 = next.A();
    const Matrix Sigma = A2 * Sigma_ * A2.transpose() + next.Sigma();
    return GaussianTransition(A2 * A_, A2 * u_ + next.u(), Sigma.symmetrized(Tags::psd()));
}

GaussianTransition GaussianTransition::update_y(const NaturalGaussian& message) const {
    // S = I + Sigma J stays invertible for PSD Sigma and J, even when either is singular.
    const Matrix S_inv = (Matrix::eye(dim()) + Sigma_ * message.J()).inverse();
    const Matrix A = S_inv * A_;
    const VectorBatch u = S_inv * (u_ + Sigma_ * message.h());
    const Matrix Sigma = (S_inv * Sigma_).symmetrized(Tags::psd());
    return GaussianTransition(A, u, Sigma);
}

NaturalGaussian GaussianTransition::backward_message(const NaturalGaussian& message) const {
    const Matrix M = (Matrix::eye(dim()) + message.J() * Sigma_).inverse();
    const Matrix J_y = (M * message.J()).symmetrized(Tags::psd());
    const VectorBatch h_y = M * message.h();
    const Matrix At = A_.transpose();
    const Matrix J = (At * J_y * A_).symmetrized(Tags::psd());
    return NaturalGaussian(J, At * (h_y - J_y * u_));
}

GaussianTransition::Reversed GaussianTransition::swap(const StandardGaussian& prior) const {
    const StandardGaussian marginal = marginalize_out_x(prior);
    // G = P A^T P_t^{-1}
    const Matrix G = prior.Sigma() * A_.transpose() * marginal.Sigma().inverse();
    const VectorBatch u = prior.mu() - G * marginal.mu();
    const Matrix Sigma = (prior.Sigma() - G * A_ * prior.Sigma()).symmetrized(Tags::psd());
    return Reversed{GaussianTransition(G, u, Sigma), marginal};
}

} // namespace linsde::potential
