#include "linsde/matrix/diagonal.hpp"
#include "linsde/matrix/dense.hpp"
#include <fmt/format.h>

namespace linsde::matrix {

namespace {

void check_length(Eigen::Index expected, const Eigen::VectorXd& x, const char* where) {
    if (x.size() != expected) {
        throw ShapeMismatchError(fmt::format(
            "{}: expected a vector of length {}, got {}", where, expected, x.size()));
    }
}

} // namespace

DiagonalMatrix::DiagonalMatrix(Eigen::VectorXd elements, Tags tags)
    : DiagonalMatrix(VectorBatch(std::move(elements)), tags) {}

DiagonalMatrix::DiagonalMatrix(VectorBatch elements, Tags tags)
    : MatrixBase(tags), elements_(std::move(elements)) {
    if (elements_.count() == 0) {
        throw std::invalid_argument("DiagonalMatrix: no elements");
    }
    const Eigen::Index n = elements_[0].size();
    for (const auto& d : elements_.items()) {
        check_length(n, d, "DiagonalMatrix");
    }
}

DiagonalMatrix DiagonalMatrix::batched(const Eigen::MatrixXd& rows, Tags tags) {
    std::vector<Eigen::VectorXd> items;
    items.reserve(static_cast<std::size_t>(rows.rows()));
    for (Eigen::Index b = 0; b < rows.rows(); ++b) {
        items.emplace_back(rows.row(b).transpose());
    }
    return DiagonalMatrix(VectorBatch::stacked(std::move(items)), tags);
}

DiagonalMatrix DiagonalMatrix::eye(Eigen::Index dim) {
    return DiagonalMatrix(Eigen::VectorXd(Eigen::VectorXd::Ones(dim)), Tags::psd());
}

DiagonalMatrix DiagonalMatrix::zeros(Eigen::Index dim) {
    return DiagonalMatrix(Eigen::VectorXd(Eigen::VectorXd::Zero(dim)), Tags::psd());
}

DenseBatch DiagonalMatrix::to_dense() const {
    return elements_.map([](const Eigen::VectorXd& d) -> Eigen::MatrixXd {
        return d.asDiagonal();
    });
}

std::unique_ptr<MatrixBase> DiagonalMatrix::transpose() const {
    return std::make_unique<DiagonalMatrix>(elements_, tags_.after_transpose());
}

std::unique_ptr<MatrixBase> DiagonalMatrix::inverse() const {
    return std::make_unique<DiagonalMatrix>(
        elements_.map([](const Eigen::VectorXd& d) -> Eigen::VectorXd { return d.cwiseInverse(); }),
        tags_.after_inverse());
}

std::unique_ptr<MatrixBase> DiagonalMatrix::scaled(double k) const {
    return std::make_unique<DiagonalMatrix>(
        elements_.map([k](const Eigen::VectorXd& d) -> Eigen::VectorXd { return k * d; }),
        tags_.after_scale(k));
}

std::unique_ptr<MatrixBase> DiagonalMatrix::exp() const {
    // Diagonal exponentials are positive.
    return std::make_unique<DiagonalMatrix>(
        elements_.map([](const Eigen::VectorXd& d) -> Eigen::VectorXd { return d.array().exp().matrix(); }),
        Tags::psd());
}

std::unique_ptr<MatrixBase> DiagonalMatrix::with_tags(Tags tags) const {
    return std::make_unique<DiagonalMatrix>(elements_, tags);
}

VectorBatch DiagonalMatrix::apply(const VectorBatch& x) const {
    const Eigen::Index n = rows();
    return zip(elements_, x, [n](const Eigen::VectorXd& d, const Eigen::VectorXd& v) -> Eigen::VectorXd {
        check_length(n, v, "DiagonalMatrix::apply");
        return d.cwiseProduct(v);
    }, "DiagonalMatrix::apply");
}

VectorBatch DiagonalMatrix::solve(const VectorBatch& x) const {
    const Eigen::Index n = rows();
    return zip(elements_, x, [n](const Eigen::VectorXd& d, const Eigen::VectorXd& v) -> Eigen::VectorXd {
        check_length(n, v, "DiagonalMatrix::solve");
        return v.cwiseQuotient(d);
    }, "DiagonalMatrix::solve");
}

} // namespace linsde::matrix
