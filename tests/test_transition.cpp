#include <gtest/gtest.h>
#include "linsde/potential/transition.hpp"

using namespace linsde;
using namespace linsde::matrix;
using namespace linsde::potential;

namespace {

Eigen::VectorXd vec(double value) {
    return vec(value);
}

Matrix scalar(double value) {
    return DiagonalMatrix(vec(value), Tags::psd());
}

// Brownian motion transition over dt in one dimension.
GaussianTransition brownian(double dt) {
    return GaussianTransition(Matrix::eye(1), zero_vector(1), scalar(dt));
}

} // namespace

TEST(GaussianTransition, SigmaIsTaggedPsd) {
    Eigen::MatrixXd S(2, 2);
    S << 2, 1,
         1, 2;
    GaussianTransition t(Matrix::eye(2), zero_vector(2), DenseMatrix(S));
    EXPECT_TRUE(t.Sigma().tags().is_psd());
    EXPECT_EQ(t.dim(), 2);
}

TEST(GaussianTransition, ShapeMismatchThrows) {
    EXPECT_THROW(GaussianTransition(Matrix::eye(2), zero_vector(3), Matrix::eye(2)), ShapeMismatchError);
    EXPECT_THROW(GaussianTransition(Matrix::eye(2), zero_vector(2), Matrix::eye(3)), ShapeMismatchError);
}

TEST(GaussianTransition, Identity) {
    auto id = GaussianTransition::identity(3);
    Eigen::VectorXd x = Eigen::VectorXd::LinSpaced(3, 1.0, 3.0);
    auto g = id.condition_on_x(x);
    EXPECT_TRUE(g.mu().item().isApprox(x));
    EXPECT_TRUE(g.Sigma().as_matrix().isZero());
}

TEST(GaussianTransition, ChainAddsBrownianVariances) {
    auto t = brownian(0.3).chain(brownian(0.7));
    EXPECT_DOUBLE_EQ(t.A().as_matrix()(0, 0), 1.0);
    EXPECT_NEAR(t.Sigma().as_matrix()(0, 0), 1.0, 1e-14);
    EXPECT_TRUE(t.A().is_diagonal());
}

TEST(GaussianTransition, ChainComposesAffineMaps) {
    GaussianTransition first(scalar(2.0), vec(1.0), scalar(0.5));
    GaussianTransition second(scalar(3.0), vec(-1.0), scalar(0.25));
    auto t = first.chain(second);

    EXPECT_DOUBLE_EQ(t.A().as_matrix()(0, 0), 6.0);
    EXPECT_DOUBLE_EQ(t.u().item()(0), 2.0);                 // 3 * 1 - 1
    EXPECT_DOUBLE_EQ(t.Sigma().as_matrix()(0, 0), 4.75);    // 9 * 0.5 + 0.25
}

TEST(GaussianTransition, MarginalizeOutX) {
    StandardGaussian prior(vec(2.0), scalar(1.0));
    GaussianTransition t(scalar(0.5), vec(1.0), scalar(0.25));
    auto m = t.marginalize_out_x(prior);

    EXPECT_DOUBLE_EQ(m.mu().item()(0), 2.0);
    EXPECT_DOUBLE_EQ(m.Sigma().as_matrix()(0, 0), 0.5);
}

TEST(GaussianTransition, UpdateWithoutInformationIsNoOp) {
    auto t = brownian(1.0).update_y(NaturalGaussian::zeros(1));
    EXPECT_DOUBLE_EQ(t.A().as_matrix()(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(t.Sigma().as_matrix()(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(t.u().item()(0), 0.0);
}

TEST(GaussianTransition, UpdateYMatchesPosterior) {
    // x1 ~ N(x0, 1), y ~ N(x1, 1): x1 | x0, y ~ N((x0 + y) / 2, 1/2)
    const double y = 4.0;
    NaturalGaussian evidence(scalar(1.0), vec(y));
    auto t = brownian(1.0).update_y(evidence);

    EXPECT_DOUBLE_EQ(t.A().as_matrix()(0, 0), 0.5);
    EXPECT_DOUBLE_EQ(t.u().item()(0), 0.5 * y);
    EXPECT_DOUBLE_EQ(t.Sigma().as_matrix()(0, 0), 0.5);
}

TEST(GaussianTransition, BackwardMessage) {
    // y ~ N(x1, 1), x1 ~ N(x0, 0.5): y | x0 ~ N(x0, 1.5)
    const double y = 3.0;
    NaturalGaussian evidence(scalar(1.0), vec(y));
    auto msg = brownian(0.5).backward_message(evidence);

    EXPECT_NEAR(msg.J().as_matrix()(0, 0), 1.0 / 1.5, 1e-14);
    EXPECT_NEAR(msg.h().item()(0), y / 1.5, 1e-14);
}

TEST(GaussianTransition, SwapInvertsKernel) {
    StandardGaussian prior(vec(0.0), scalar(1.0));
    auto reversed = brownian(1.0).swap(prior);

    EXPECT_DOUBLE_EQ(reversed.marginal.Sigma().as_matrix()(0, 0), 2.0);
    EXPECT_DOUBLE_EQ(reversed.transition.A().as_matrix()(0, 0), 0.5);
    EXPECT_DOUBLE_EQ(reversed.transition.Sigma().as_matrix()(0, 0), 0.5);
    EXPECT_DOUBLE_EQ(reversed.transition.u().item()(0), 0.0);
}

TEST(GaussianTransition, DenseUpdateMatchesKalmanCorrection) {
    Eigen::MatrixXd A(2, 2);
    A << 1, 0.5,
         0, 1;
    Eigen::MatrixXd S(2, 2);
    S << 0.2, 0.05,
         0.05, 0.5;
    Eigen::MatrixXd J(2, 2);
    J << 4, 0,
         0, 1;
    Eigen::VectorXd y(2);
    y << 1.0, -1.0;
    Eigen::VectorXd x0(2);
    x0 << 0.3, 0.1;

    GaussianTransition t(DenseMatrix(A), zero_vector(2), DenseMatrix(S, Tags::psd()));
    auto post = t.update_y(MixedGaussian(y, DenseMatrix(J, Tags::psd())).to_natural()).condition_on_x(x0);

    // Kalman correction with identity measurement and noise J^-1.
    const Eigen::VectorXd m = A * x0;
    const Eigen::MatrixXd R = J.inverse();
    const Eigen::MatrixXd K = S * (S + R).inverse();
    const Eigen::VectorXd expected_mean = m + K * (y - m);
    const Eigen::MatrixXd expected_cov = (Eigen::MatrixXd::Identity(2, 2) - K) * S;

    EXPECT_TRUE(post.mu().item().isApprox(expected_mean, 1e-12));
    EXPECT_TRUE(post.Sigma().as_matrix().isApprox(expected_cov, 1e-12));
}
