#include <gtest/gtest.h>
#include "linsde/potential/gaussian.hpp"
#include <cmath>
#include <numbers>

using namespace linsde;
using namespace linsde::matrix;
using namespace linsde::potential;

TEST(StandardGaussian, ConvertsToMixedAndNatural) {
    Eigen::VectorXd mu(2);
    mu << 1.0, -2.0;
    StandardGaussian g(mu, Matrix(DiagonalMatrix(Eigen::VectorXd::Constant(2, 4.0), Tags::psd())));

    MixedGaussian mixed = g.to_mixed();
    EXPECT_DOUBLE_EQ(mixed.J().elements()(0, 0), 0.25);
    EXPECT_TRUE(mixed.mu().item().isApprox(mu));

    NaturalGaussian natural = g.to_natural();
    EXPECT_DOUBLE_EQ(natural.h().item()(0), 0.25);
    EXPECT_DOUBLE_EQ(natural.h().item()(1), -0.5);

    StandardGaussian back = natural.to_standard();
    EXPECT_TRUE(back.mu().item().isApprox(mu));
    EXPECT_TRUE(back.Sigma().as_matrix().isApprox(g.Sigma().as_matrix()));
}

TEST(StandardGaussian, LogProbMatchesScalarDensity) {
    Eigen::VectorXd mu = Eigen::VectorXd::Zero(1);
    StandardGaussian g(mu, Matrix(DiagonalMatrix(Eigen::VectorXd::Constant(1, 2.0), Tags::psd())));

    Eigen::VectorXd x = Eigen::VectorXd::Constant(1, 1.0);
    const double expected = -0.5 * (std::log(2.0 * std::numbers::pi * 2.0) + 0.5);
    EXPECT_NEAR(g.log_prob(x).item(), expected, 1e-12);
}

TEST(MixedGaussian, ProductAddsPrecisions) {
    Eigen::VectorXd a_mu = Eigen::VectorXd::Constant(1, 0.0);
    Eigen::VectorXd b_mu = Eigen::VectorXd::Constant(1, 3.0);
    MixedGaussian a(a_mu, Matrix(DiagonalMatrix(Eigen::VectorXd::Constant(1, 1.0), Tags::psd())));
    MixedGaussian b(b_mu, Matrix(DiagonalMatrix(Eigen::VectorXd::Constant(1, 2.0), Tags::psd())));

    MixedGaussian c = a * b;
    EXPECT_DOUBLE_EQ(c.J().elements()(0, 0), 3.0);
    EXPECT_DOUBLE_EQ(c.mu().item()(0), 2.0);
}

TEST(NaturalGaussian, ZerosCarryNoInformation) {
    NaturalGaussian z = NaturalGaussian::zeros(3);
    EXPECT_EQ(z.dim(), 3);
    EXPECT_TRUE(z.J().as_matrix().isZero());
    EXPECT_TRUE(z.h().item().isZero());
    EXPECT_FALSE(z.batch_size().has_value());
}

TEST(MixedGaussian, DimensionMismatchThrows) {
    Eigen::VectorXd mu = Eigen::VectorXd::Zero(3);
    EXPECT_THROW(MixedGaussian(mu, Matrix::eye(2)), ShapeMismatchError);
}

TEST(MixedGaussian, BatchedMeanWithSharedPrecision) {
    auto mu = VectorBatch::stacked({Eigen::VectorXd::Zero(2), Eigen::VectorXd::Ones(2)});
    MixedGaussian g(mu, Matrix::eye(2));
    ASSERT_TRUE(g.batch_size().has_value());
    EXPECT_EQ(*g.batch_size(), 2u);

    StandardGaussian s = g.to_standard();
    EXPECT_DOUBLE_EQ(s.mu()[1](0), 1.0);
}
