#include "linsde/potential/gaussian.hpp"
#include <cmath>
#include <fmt/format.h>
#include <numbers>

namespace linsde::potential {

using matrix::Matrix;
using matrix::Tags;
using matrix::VectorBatch;

namespace {

void check_square(const Matrix& M, const char* where) {
    if (M.rows() != M.cols()) {
        throw ShapeMismatchError(fmt::format("{}: matrix must be square, got {}x{}", where, M.rows(), M.cols()));
    }
}

void check_vector(const VectorBatch& v, Eigen::Index dim, const char* where) {
    for (const auto& x : v.items()) {
        if (x.size() != dim) {
            throw ShapeMismatchError(fmt::format(
                "{}: vector of length {} does not match dimension {}", where, x.size(), dim));
        }
    }
}

} // namespace

// ---- StandardGaussian ----

StandardGaussian::StandardGaussian(VectorBatch mu, Matrix Sigma)
    : mu_(std::move(mu)), Sigma_(std::move(Sigma)) {
    check_square(Sigma_, "StandardGaussian");
    check_vector(mu_, Sigma_.rows(), "StandardGaussian");
    batch_size_ = matrix::broadcast_batch_size(mu_.batch_size(), Sigma_.batch_size(), "StandardGaussian");
}

MixedGaussian StandardGaussian::to_mixed() const {
    return MixedGaussian(mu_, Sigma_.inverse());
}

NaturalGaussian StandardGaussian::to_natural() const {
    const Matrix J = Sigma_.inverse();
    return NaturalGaussian(J, J * mu_);
}

matrix::Batch<double> StandardGaussian::log_prob(const VectorBatch& x) const {
    const VectorBatch diff = x - mu_;
    return matrix::zip(Sigma_.to_dense(), diff,
        [](const Eigen::MatrixXd& S, const Eigen::VectorXd& d) -> double {
            const auto ldlt = S.ldlt();
            const double log_det = ldlt.vectorD().array().log().sum();
            const double mahal = d.dot(ldlt.solve(d));
            const double n = static_cast<double>(d.size());
            return -0.5 * (n * std::log(2.0 * std::numbers::pi) + log_det + mahal);
        }, "StandardGaussian::log_prob");
}

// ---- MixedGaussian ----

MixedGaussian::MixedGaussian(VectorBatch mu, Matrix J)
    : mu_(std::move(mu)), J_(std::move(J)) {
    check_square(J_, "MixedGaussian");
    check_vector(mu_, J_.rows(), "MixedGaussian");
    batch_size_ = matrix::broadcast_batch_size(mu_.batch_size(), J_.batch_size(), "MixedGaussian");
}

StandardGaussian MixedGaussian::to_standard() const {
    return StandardGaussian(mu_, J_.inverse());
}

NaturalGaussian MixedGaussian::to_natural() const {
    return NaturalGaussian(J_, J_ * mu_);
}

MixedGaussian operator*(const MixedGaussian& a, const MixedGaussian& b) {
    const Matrix J = (a.J() + b.J()).with_tags(Tags::psd());
    const VectorBatch h = a.J() * a.mu() + b.J() * b.mu();
    return MixedGaussian(J.solve(h), J);
}

// ---- NaturalGaussian ----

NaturalGaussian::NaturalGaussian(Matrix J, VectorBatch h)
    : J_(std::move(J)), h_(std::move(h)) {
    check_square(J_, "NaturalGaussian");
    check_vector(h_, J_.rows(), "NaturalGaussian");
    batch_size_ = matrix::broadcast_batch_size(J_.batch_size(), h_.batch_size(), "NaturalGaussian");
}

NaturalGaussian NaturalGaussian::zeros(Eigen::Index dim) {
    return NaturalGaussian(Matrix::zeros(dim), matrix::zero_vector(dim));
}

StandardGaussian NaturalGaussian::to_standard() const {
    const Matrix Sigma = J_.inverse();
    return StandardGaussian(Sigma * h_, Sigma);
}

MixedGaussian NaturalGaussian::to_mixed() const {
    return MixedGaussian(J_.solve(h_), J_);
}

NaturalGaussian operator+(const NaturalGaussian& a, const NaturalGaussian& b) {
    if (a.dim() != b.dim()) {
        throw ShapeMismatchError(fmt::format(
            "NaturalGaussian product: dimensions {} and {} differ", a.dim(), b.dim()));
    }
    return NaturalGaussian((a.J() + b.J()).with_tags(matrix::Tags::psd()), a.h() + b.h());
}

} // namespace linsde::potential
