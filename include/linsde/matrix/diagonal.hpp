#pragma once

#include "linsde/matrix/matrix_base.hpp"

namespace linsde::matrix {

/// Diagonal matrix stored as its diagonal.
/// Exponential, inverse and products are elementwise.
class DiagonalMatrix : public MatrixBase {
public:
    explicit DiagonalMatrix(Eigen::VectorXd elements, Tags tags = Tags::no_tags());
    explicit DiagonalMatrix(VectorBatch elements, Tags tags = Tags::no_tags());

    /// Batched diagonal matrix; row b of `rows` is the diagonal of batch item b.
    [[nodiscard]] static DiagonalMatrix batched(const Eigen::MatrixXd& rows, Tags tags = Tags::no_tags());

    [[nodiscard]] static DiagonalMatrix eye(Eigen::Index dim);
    [[nodiscard]] static DiagonalMatrix zeros(Eigen::Index dim);

    [[nodiscard]] std::unique_ptr<MatrixBase> clone() const override {
        return std::make_unique<DiagonalMatrix>(*this);
    }

    [[nodiscard]] MatrixKind kind() const override { return MatrixKind::Diagonal; }
    [[nodiscard]] Eigen::Index rows() const override { return elements_[0].size(); }
    [[nodiscard]] Eigen::Index cols() const override { return elements_[0].size(); }
    [[nodiscard]] BatchSize batch_size() const override { return elements_.batch_size(); }

    [[nodiscard]] const VectorBatch& diagonal() const { return elements_; }

    [[nodiscard]] Eigen::MatrixXd elements(std::size_t b) const override { return elements_[b]; }
    [[nodiscard]] DenseBatch to_dense() const override;

    [[nodiscard]] std::unique_ptr<MatrixBase> transpose() const override;
    [[nodiscard]] std::unique_ptr<MatrixBase> inverse() const override;
    [[nodiscard]] std::unique_ptr<MatrixBase> scaled(double k) const override;
    [[nodiscard]] std::unique_ptr<MatrixBase> exp() const override;
    [[nodiscard]] std::unique_ptr<MatrixBase> with_tags(Tags tags) const override;

    [[nodiscard]] VectorBatch apply(const VectorBatch& x) const override;
    [[nodiscard]] VectorBatch solve(const VectorBatch& x) const override;

private:
    VectorBatch elements_;
};

} // namespace linsde::matrix
