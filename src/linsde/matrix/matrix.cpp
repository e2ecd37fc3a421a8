#include "linsde/matrix/matrix.hpp"
#include <fmt/format.h>

namespace linsde::matrix {

namespace {

void check_same_shape(const Matrix& a, const Matrix& b, const char* where) {
    if (a.rows() != b.rows() || a.cols() != b.cols()) {
        throw ShapeMismatchError(fmt::format("{}: shapes differ, {} and {}", where, a.describe(), b.describe()));
    }
}

const char* kind_name(MatrixKind kind) {
    return kind == MatrixKind::Diagonal ? "DiagonalMatrix" : "DenseMatrix";
}

} // namespace

Matrix::Matrix(std::shared_ptr<const MatrixBase> impl) : impl_(std::move(impl)) {
    if (!impl_) {
        throw std::invalid_argument("Matrix: null representation");
    }
}

Matrix Matrix::symmetrized(Tags tags) const {
    if (is_diagonal()) {
        return with_tags(tags);
    }
    return DenseMatrix(
        to_dense().map([](const Eigen::MatrixXd& m) -> Eigen::MatrixXd {
            return 0.5 * (m + m.transpose());
        }),
        tags);
}

std::string Matrix::describe() const {
    const auto bs = batch_size();
    return fmt::format("{}({}x{}, tags={}, batch={})", kind_name(kind()), rows(), cols(),
                       tags().to_string(), bs ? std::to_string(*bs) : std::string("none"));
}

// ---- Binary algebra ----

Matrix operator*(const Matrix& a, const Matrix& b) {
    if (a.cols() != b.rows()) {
        throw ShapeMismatchError(fmt::format("matmul: cannot multiply {} by {}", a.describe(), b.describe()));
    }
    const auto* da = a.as<DiagonalMatrix>();
    const auto* db = b.as<DiagonalMatrix>();

    if (da && db) {
        return DiagonalMatrix(
            zip(da->diagonal(), db->diagonal(),
                [](const Eigen::VectorXd& x, const Eigen::VectorXd& y) -> Eigen::VectorXd {
                    return x.cwiseProduct(y);
                }, "matmul"));
    }
    if (da) {
        return DenseMatrix(
            zip(da->diagonal(), b.to_dense(),
                [](const Eigen::VectorXd& d, const Eigen::MatrixXd& m) -> Eigen::MatrixXd {
                    return d.asDiagonal() * m;
                }, "matmul"));
    }
    if (db) {
        return DenseMatrix(
            zip(a.to_dense(), db->diagonal(),
                [](const Eigen::MatrixXd& m, const Eigen::VectorXd& d) -> Eigen::MatrixXd {
                    return m * d.asDiagonal();
                }, "matmul"));
    }
    return DenseMatrix(
        zip(a.to_dense(), b.to_dense(),
            [](const Eigen::MatrixXd& x, const Eigen::MatrixXd& y) -> Eigen::MatrixXd {
                return x * y;
            }, "matmul"));
}

Matrix operator+(const Matrix& a, const Matrix& b) {
    check_same_shape(a, b, "add");
    const Tags tags = a.tags().after_add(b.tags());
    const auto* da = a.as<DiagonalMatrix>();
    const auto* db = b.as<DiagonalMatrix>();
    if (da && db) {
        return DiagonalMatrix(
            zip(da->diagonal(), db->diagonal(),
                [](const Eigen::VectorXd& x, const Eigen::VectorXd& y) -> Eigen::VectorXd {
                    return x + y;
                }, "add"),
            tags);
    }
    return DenseMatrix(
        zip(a.to_dense(), b.to_dense(),
            [](const Eigen::MatrixXd& x, const Eigen::MatrixXd& y) -> Eigen::MatrixXd {
                return x + y;
            }, "add"),
        tags);
}

Matrix operator-(const Matrix& a, const Matrix& b) {
    check_same_shape(a, b, "subtract");
    const Tags tags = (a.tags().is_symmetric() && b.tags().is_symmetric())
        ? Tags::symmetric() : Tags::no_tags();
    const auto* da = a.as<DiagonalMatrix>();
    const auto* db = b.as<DiagonalMatrix>();
    if (da && db) {
        return DiagonalMatrix(
            zip(da->diagonal(), db->diagonal(),
                [](const Eigen::VectorXd& x, const Eigen::VectorXd& y) -> Eigen::VectorXd {
                    return x - y;
                }, "subtract"),
            tags);
    }
    return DenseMatrix(
        zip(a.to_dense(), b.to_dense(),
            [](const Eigen::MatrixXd& x, const Eigen::MatrixXd& y) -> Eigen::MatrixXd {
                return x - y;
            }, "subtract"),
        tags);
}

Matrix operator*(double k, const Matrix& a) { return a.scaled(k); }
Matrix operator*(const Matrix& a, double k) { return a.scaled(k); }

VectorBatch operator*(const Matrix& a, const VectorBatch& x) { return a.impl().apply(x); }

BatchSize common_batch_size(std::initializer_list<BatchSize> sizes, const char* where) {
    BatchSize out;
    for (const auto& s : sizes) {
        out = broadcast_batch_size(out, s, where);
    }
    return out;
}

} // namespace linsde::matrix
