#include <gtest/gtest.h>
#include "linsde/sde/brownian_motion.hpp"
#include "linsde/sde/conditioned_linear_sde.hpp"
#include "linsde/sde/ornstein_uhlenbeck.hpp"
#include "linsde/sde/sampling.hpp"
#include <EigenRand/EigenRand>

using namespace linsde;
using namespace linsde::matrix;
using namespace linsde::potential;
using namespace linsde::sde;

TEST(Sampling, GaussianMoments) {
    Rng rng(42);
    Eigen::VectorXd mean(2);
    mean << 1.0, -2.0;
    Eigen::MatrixXd cov(2, 2);
    cov << 2.0, 0.6,
           0.6, 1.0;

    const int n = 4000;
    Eigen::MatrixXd draws(n, 2);
    for (int i = 0; i < n; ++i) {
        draws.row(i) = sample_gaussian(mean, cov, rng).transpose();
    }
    const Eigen::RowVectorXd m = draws.colwise().mean();
    const Eigen::MatrixXd centered = draws.rowwise() - m;
    const Eigen::MatrixXd c = centered.transpose() * centered / (n - 1);

    EXPECT_NEAR(m(0), 1.0, 0.1);
    EXPECT_NEAR(m(1), -2.0, 0.1);
    EXPECT_NEAR(c(0, 0), 2.0, 0.2);
    EXPECT_NEAR(c(0, 1), 0.6, 0.15);
}

TEST(Sampling, DegenerateCovariance) {
    Rng rng(7);
    Eigen::VectorXd mean = Eigen::VectorXd::Constant(3, 2.5);
    const Eigen::VectorXd x = sample_gaussian(mean, Eigen::MatrixXd::Zero(3, 3), rng);
    EXPECT_TRUE(x.isApprox(mean));
}

TEST(Sampling, BrownianEndpointStatistics) {
    Rng rng(42);
    BrownianMotion bm(1.0, 1);
    const std::vector<double> times{0.0, 0.5, 1.0};

    const int n = 2000;
    Eigen::VectorXd ends(n);
    for (int i = 0; i < n; ++i) {
        const Eigen::MatrixXd path = sample_path(bm, Eigen::VectorXd::Zero(1), times, rng);
        ASSERT_EQ(path.rows(), 3);
        EXPECT_DOUBLE_EQ(path(0, 0), 0.0);
        ends(i) = path(2, 0);
    }
    const double mean = ends.mean();
    const double var = (ends.array() - mean).square().sum() / (n - 1);
    EXPECT_NEAR(mean, 0.0, 0.1);
    EXPECT_NEAR(var, 1.0, 0.15);
}

TEST(Sampling, ConditionedPathHitsObservation) {
    Rng rng(42);
    auto bm = std::make_shared<BrownianMotion>(1.0, 1);
    auto evidence = std::make_shared<GaussianPotentialSeries>(GaussianPotentialSeries::single(
        1.0, MixedGaussian(Eigen::VectorXd(Eigen::VectorXd::Constant(1, 5.0)),
                           DiagonalMatrix(Eigen::VectorXd::Constant(1, 1e8), Tags::psd()))));
    auto bridge = bm->condition_on(evidence);

    std::vector<double> times;
    for (int k = 0; k <= 10; ++k) {
        times.push_back(0.1 * k);
    }
    times.back() = 1.0;

    const Eigen::MatrixXd path = sample_path(*bridge, Eigen::VectorXd::Zero(1), times, rng);
    EXPECT_NEAR(path(10, 0), 5.0, 1e-2);
}

TEST(Sampling, RejectsBadArguments) {
    Rng rng(1);
    OrnsteinUhlenbeck ou(1.0, 1.0, 2);
    EXPECT_THROW((void)sample_path(ou, Eigen::VectorXd::Zero(3), {0.0, 1.0}, rng), ShapeMismatchError);
    EXPECT_THROW((void)sample_path(ou, Eigen::VectorXd::Zero(2), {}, rng), std::invalid_argument);
    EXPECT_THROW((void)sample_path(ou, Eigen::VectorXd::Zero(2), {0.0, 1.0, 0.5}, rng), std::invalid_argument);

    LinearTimeInvariantSDE batched(DiagonalMatrix::batched(Eigen::MatrixXd::Ones(2, 2)), Matrix::eye(2));
    EXPECT_THROW((void)sample_path(batched, Eigen::VectorXd::Zero(2), {0.0, 1.0}, rng), BatchMismatchError);
}
