#pragma once

#include "linsde/matrix/matrix_base.hpp"
#include <vector>

namespace linsde::matrix {

/// General dense matrix.
/// Matrices tagged PSD are inverted and solved through LDLT, others through LU.
class DenseMatrix : public MatrixBase {
public:
    explicit DenseMatrix(Eigen::MatrixXd elements, Tags tags = Tags::no_tags());
    explicit DenseMatrix(DenseBatch elements, Tags tags = Tags::no_tags());

    [[nodiscard]] static DenseMatrix batched(std::vector<Eigen::MatrixXd> items, Tags tags = Tags::no_tags());

    [[nodiscard]] std::unique_ptr<MatrixBase> clone() const override {
        return std::make_unique<DenseMatrix>(*this);
    }

    [[nodiscard]] MatrixKind kind() const override { return MatrixKind::Dense; }
    [[nodiscard]] Eigen::Index rows() const override { return elements_[0].rows(); }
    [[nodiscard]] Eigen::Index cols() const override { return elements_[0].cols(); }
    [[nodiscard]] BatchSize batch_size() const override { return elements_.batch_size(); }

    [[nodiscard]] const DenseBatch& values() const { return elements_; }

    [[nodiscard]] Eigen::MatrixXd elements(std::size_t b) const override { return elements_[b]; }
    [[nodiscard]] DenseBatch to_dense() const override { return elements_; }

    [[nodiscard]] std::unique_ptr<MatrixBase> transpose() const override;
    [[nodiscard]] std::unique_ptr<MatrixBase> inverse() const override;
    [[nodiscard]] std::unique_ptr<MatrixBase> scaled(double k) const override;
    [[nodiscard]] std::unique_ptr<MatrixBase> exp() const override;
    [[nodiscard]] std::unique_ptr<MatrixBase> with_tags(Tags tags) const override;

    [[nodiscard]] VectorBatch apply(const VectorBatch& x) const override;
    [[nodiscard]] VectorBatch solve(const VectorBatch& x) const override;

private:
    DenseBatch elements_;
};

} // namespace linsde::matrix
