#include "linsde/matrix/dense.hpp"
#include <fmt/format.h>
#include <unsupported/Eigen/MatrixFunctions>

namespace linsde::matrix {

DenseMatrix::DenseMatrix(Eigen::MatrixXd elements, Tags tags)
    : DenseMatrix(DenseBatch(std::move(elements)), tags) {}

DenseMatrix::DenseMatrix(DenseBatch elements, Tags tags)
    : MatrixBase(tags), elements_(std::move(elements)) {
    if (elements_.count() == 0) {
        throw std::invalid_argument("DenseMatrix: no elements");
    }
    const Eigen::Index r = elements_[0].rows();
    const Eigen::Index c = elements_[0].cols();
    for (const auto& m : elements_.items()) {
        if (m.rows() != r || m.cols() != c) {
            throw ShapeMismatchError(fmt::format(
                "DenseMatrix: batch items have shapes {}x{} and {}x{}", r, c, m.rows(), m.cols()));
        }
    }
    if (tags_.is_symmetric() && r != c) {
        throw ShapeMismatchError(fmt::format(
            "DenseMatrix: a {}x{} matrix cannot be tagged {}", r, c, tags_.to_string()));
    }
}

DenseMatrix DenseMatrix::batched(std::vector<Eigen::MatrixXd> items, Tags tags) {
    return DenseMatrix(DenseBatch::stacked(std::move(items)), tags);
}

std::unique_ptr<MatrixBase> DenseMatrix::transpose() const {
    return std::make_unique<DenseMatrix>(
        elements_.map([](const Eigen::MatrixXd& m) -> Eigen::MatrixXd { return m.transpose(); }),
        tags_.after_transpose());
}

std::unique_ptr<MatrixBase> DenseMatrix::inverse() const {
    if (rows() != cols()) {
        throw ShapeMismatchError(fmt::format("DenseMatrix::inverse: matrix is {}x{}", rows(), cols()));
    }
    const bool psd = tags_.is_psd();
    return std::make_unique<DenseMatrix>(
        elements_.map([psd](const Eigen::MatrixXd& m) -> Eigen::MatrixXd {
            const Eigen::MatrixXd I = Eigen::MatrixXd::Identity(m.rows(), m.cols());
            if (psd) {
                return m.ldlt().solve(I);
            }
            return m.partialPivLu().solve(I);
        }),
        tags_.after_inverse());
}

std::unique_ptr<MatrixBase> DenseMatrix::scaled(double k) const {
    return std::make_unique<DenseMatrix>(
        elements_.map([k](const Eigen::MatrixXd& m) -> Eigen::MatrixXd { return k * m; }),
        tags_.after_scale(k));
}

std::unique_ptr<MatrixBase> DenseMatrix::exp() const {
    if (rows() != cols()) {
        throw ShapeMismatchError(fmt::format("DenseMatrix::exp: matrix is {}x{}", rows(), cols()));
    }
    const Tags out = tags_.is_symmetric() ? Tags::psd() : Tags::no_tags();
    return std::make_unique<DenseMatrix>(
        elements_.map([](const Eigen::MatrixXd& m) -> Eigen::MatrixXd { return m.exp(); }),
        out);
}

std::unique_ptr<MatrixBase> DenseMatrix::with_tags(Tags tags) const {
    return std::make_unique<DenseMatrix>(elements_, tags);
}

VectorBatch DenseMatrix::apply(const VectorBatch& x) const {
    return zip(elements_, x, [](const Eigen::MatrixXd& m, const Eigen::VectorXd& v) -> Eigen::VectorXd {
        if (m.cols() != v.size()) {
            throw ShapeMismatchError(fmt::format(
                "DenseMatrix::apply: {}x{} matrix times vector of length {}", m.rows(), m.cols(), v.size()));
        }
        return m * v;
    }, "DenseMatrix::apply");
}

VectorBatch DenseMatrix::solve(const VectorBatch& x) const {
    const bool psd = tags_.is_psd();
    return zip(elements_, x, [psd](const Eigen::MatrixXd& m, const Eigen::VectorXd& v) -> Eigen::VectorXd {
        if (m.rows() != m.cols() || m.rows() != v.size()) {
            throw ShapeMismatchError(fmt::format(
                "DenseMatrix::solve: {}x{} system with right-hand side of length {}", m.rows(), m.cols(), v.size()));
        }
        if (psd) {
            return m.ldlt().solve(v);
        }
        return m.partialPivLu().solve(v);
    }, "DenseMatrix::solve");
}

} // namespace linsde::matrix
