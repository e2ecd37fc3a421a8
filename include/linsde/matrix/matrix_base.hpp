#pragma once

#include "linsde/matrix/batch.hpp"
#include "linsde/matrix/tags.hpp"
#include <Eigen/Dense>
#include <memory>

namespace linsde::matrix {

enum class MatrixKind { Dense, Diagonal };

/// Abstract base class for structured matrices.
/// Every representation supports the same algebra; binary operations between
/// two representations are dispatched in matrix.cpp.
class MatrixBase {
public:
    virtual ~MatrixBase() = default;

    [[nodiscard]] virtual std::unique_ptr<MatrixBase> clone() const = 0;

    [[nodiscard]] virtual MatrixKind kind() const = 0;
    [[nodiscard]] virtual Eigen::Index rows() const = 0;
    [[nodiscard]] virtual Eigen::Index cols() const = 0;
    [[nodiscard]] virtual BatchSize batch_size() const = 0;

    /// Stored representation of batch item b (the diagonal as a column for diagonal matrices).
    [[nodiscard]] virtual Eigen::MatrixXd elements(std::size_t b) const = 0;

    /// Dense equivalent, one matrix per batch item.
    [[nodiscard]] virtual DenseBatch to_dense() const = 0;

    [[nodiscard]] virtual std::unique_ptr<MatrixBase> transpose() const = 0;
    [[nodiscard]] virtual std::unique_ptr<MatrixBase> inverse() const = 0;
    [[nodiscard]] virtual std::unique_ptr<MatrixBase> scaled(double k) const = 0;

    /// Matrix exponential.
    [[nodiscard]] virtual std::unique_ptr<MatrixBase> exp() const = 0;

    [[nodiscard]] virtual std::unique_ptr<MatrixBase> with_tags(Tags tags) const = 0;

    /// Matrix-vector product.
    [[nodiscard]] virtual VectorBatch apply(const VectorBatch& x) const = 0;

    /// Solve M y = x for y.
    [[nodiscard]] virtual VectorBatch solve(const VectorBatch& x) const = 0;

    [[nodiscard]] const Tags& tags() const { return tags_; }

protected:
    explicit MatrixBase(Tags tags) : tags_(tags) {}

    Tags tags_;
};

} // namespace linsde::matrix
