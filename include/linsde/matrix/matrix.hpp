#pragma once

#include "linsde/matrix/dense.hpp"
#include "linsde/matrix/diagonal.hpp"
#include "linsde/matrix/matrix_base.hpp"
#include <initializer_list>
#include <memory>
#include <string>

namespace linsde::matrix {

/// Immutable handle to a structured matrix.
/// Copies share the underlying representation. All operations return new handles.
class Matrix {
public:
    Matrix(const DiagonalMatrix& m) : impl_(std::make_shared<DiagonalMatrix>(m)) {}
    Matrix(const DenseMatrix& m) : impl_(std::make_shared<DenseMatrix>(m)) {}
    explicit Matrix(std::shared_ptr<const MatrixBase> impl);

    [[nodiscard]] static Matrix eye(Eigen::Index dim) { return DiagonalMatrix::eye(dim); }
    [[nodiscard]] static Matrix zeros(Eigen::Index dim) { return DiagonalMatrix::zeros(dim); }

    // ---- Structure ----

    [[nodiscard]] MatrixKind kind() const { return impl_->kind(); }
    [[nodiscard]] bool is_diagonal() const { return kind() == MatrixKind::Diagonal; }
    [[nodiscard]] bool is_dense() const { return kind() == MatrixKind::Dense; }
    [[nodiscard]] Eigen::Index rows() const { return impl_->rows(); }
    [[nodiscard]] Eigen::Index cols() const { return impl_->cols(); }
    [[nodiscard]] BatchSize batch_size() const { return impl_->batch_size(); }
    [[nodiscard]] const Tags& tags() const { return impl_->tags(); }

    [[nodiscard]] const MatrixBase& impl() const { return *impl_; }

    /// Downcast to a concrete representation, nullptr on kind mismatch.
    template <typename T>
    [[nodiscard]] const T* as() const { return dynamic_cast<const T*>(impl_.get()); }

    // ---- Element access ----

    /// Stored elements of batch item b: the diagonal (as a column) or the dense matrix.
    [[nodiscard]] Eigen::MatrixXd elements(std::size_t b = 0) const { return impl_->elements(b); }
    [[nodiscard]] Eigen::MatrixXd as_matrix(std::size_t b = 0) const { return impl_->to_dense()[b]; }
    [[nodiscard]] DenseBatch to_dense() const { return impl_->to_dense(); }

    // ---- Unary algebra ----

    [[nodiscard]] Matrix transpose() const { return Matrix(impl_->transpose()); }
    [[nodiscard]] Matrix inverse() const { return Matrix(impl_->inverse()); }
    [[nodiscard]] Matrix scaled(double k) const { return Matrix(impl_->scaled(k)); }
    [[nodiscard]] Matrix exp() const { return Matrix(impl_->exp()); }
    [[nodiscard]] Matrix with_tags(Tags tags) const { return Matrix(impl_->with_tags(tags)); }

    /// (M + M^T) / 2, tagged symmetric (or PSD when requested).
    [[nodiscard]] Matrix symmetrized(Tags tags = Tags::symmetric()) const;

    [[nodiscard]] VectorBatch solve(const VectorBatch& x) const { return impl_->solve(x); }

    [[nodiscard]] std::string describe() const;

private:
    std::shared_ptr<const MatrixBase> impl_;
};

// ---- Binary algebra ----

Matrix operator*(const Matrix& a, const Matrix& b);
Matrix operator+(const Matrix& a, const Matrix& b);
Matrix operator-(const Matrix& a, const Matrix& b);
Matrix operator*(double k, const Matrix& a);
Matrix operator*(const Matrix& a, double k);
VectorBatch operator*(const Matrix& a, const VectorBatch& x);

/// Batch size shared by a set of operands, broadcasting unbatched ones.
BatchSize common_batch_size(std::initializer_list<BatchSize> sizes, const char* where);

} // namespace linsde::matrix
