#include <gtest/gtest.h>
#include "linsde/sde/brownian_motion.hpp"
#include "linsde/sde/conditioned_linear_sde.hpp"
#include "linsde/sde/ornstein_uhlenbeck.hpp"
#include "linsde/sde/wiener_velocity_model.hpp"

using namespace linsde;
using namespace linsde::matrix;
using namespace linsde::potential;
using namespace linsde::sde;

namespace {

Eigen::VectorXd scalar_vector(double value) {
    return Eigen::VectorXd::Constant(1, value);
}

Matrix precision(double value) {
    return DiagonalMatrix(scalar_vector(value), Tags::psd());
}

std::shared_ptr<const GaussianPotentialSeries> scalar_evidence(
    std::vector<double> times, const std::vector<double>& values, const std::vector<double>& precisions) {
    std::vector<MixedGaussian> potentials;
    for (std::size_t i = 0; i < values.size(); ++i) {
        potentials.emplace_back(scalar_vector(values[i]), precision(precisions[i]));
    }
    return std::make_shared<GaussianPotentialSeries>(std::move(times), std::move(potentials));
}

double scalar(const Matrix& m) { return m.as_matrix()(0, 0); }

// Constant-velocity model (sigma = 1, one position dimension) in closed form.
Eigen::MatrixXd cv_A(double dt) {
    Eigen::MatrixXd A(2, 2);
    A << 1, dt,
         0, 1;
    return A;
}

Eigen::MatrixXd cv_Q(double dt) {
    Eigen::MatrixXd Q(2, 2);
    Q << dt * dt * dt / 3, dt * dt / 2,
         dt * dt / 2,      dt;
    return Q;
}

// Cov(x_a, x_b) for a path started at a fixed state at time 0.
Eigen::MatrixXd cv_cross(double a, double b) {
    if (a <= b) {
        return cv_Q(a) * cv_A(b - a).transpose();
    }
    return cv_cross(b, a).transpose();
}

} // namespace

TEST(ConditionedLinearSDE, EvidenceInsideInterval) {
    auto bm = std::make_shared<BrownianMotion>(1.0, 1);
    auto conditioned = bm->condition_on(scalar_evidence({0.5}, {2.0}, {2.0}));

    const auto t = conditioned->get_transition_distribution(0.0, 1.0);
    EXPECT_NEAR(scalar(t.A()), 0.5, 1e-12);
    EXPECT_NEAR(t.u().item()(0), 1.0, 1e-12);
    EXPECT_NEAR(scalar(t.Sigma()), 0.75, 1e-12);
}

TEST(ConditionedLinearSDE, EvidenceAfterInterval) {
    const double y = 3.0;
    auto bm = std::make_shared<BrownianMotion>(1.0, 1);
    auto conditioned = bm->condition_on(scalar_evidence({1.0}, {y}, {1.0}));

    const auto t = conditioned->get_transition_distribution(0.0, 0.5);
    EXPECT_NEAR(scalar(t.A()), 0.75, 1e-12);
    EXPECT_NEAR(t.u().item()(0), 0.25 * y, 1e-12);
    EXPECT_NEAR(scalar(t.Sigma()), 0.375, 1e-12);
}

TEST(ConditionedLinearSDE, EvidenceAtEndOfInterval) {
    const double y = -1.5;
    auto bm = std::make_shared<BrownianMotion>(1.0, 1);
    auto conditioned = bm->condition_on(scalar_evidence({1.0}, {y}, {1.0}));

    const auto t = conditioned->get_transition_distribution(0.0, 1.0);
    EXPECT_NEAR(scalar(t.A()), 0.5, 1e-12);
    EXPECT_NEAR(t.u().item()(0), 0.5 * y, 1e-12);
    EXPECT_NEAR(scalar(t.Sigma()), 0.5, 1e-12);
}

TEST(ConditionedLinearSDE, NoEvidenceAheadLeavesBaseUnchanged) {
    auto ou = std::make_shared<OrnsteinUhlenbeck>(1.0, 0.5, 1);
    auto conditioned = ou->condition_on(scalar_evidence({1.0}, {4.0}, {1.0}));

    const auto a = conditioned->get_transition_distribution(1.5, 2.5);
    const auto b = ou->get_transition_distribution(1.5, 2.5);
    EXPECT_NEAR(scalar(a.A()), scalar(b.A()), 1e-14);
    EXPECT_NEAR(scalar(a.Sigma()), scalar(b.Sigma()), 1e-14);
    EXPECT_NEAR(a.u().item()(0), 0.0, 1e-14);

    const auto msg = conditioned->backward_message(1.5);
    EXPECT_DOUBLE_EQ(scalar(msg.J()), 0.0);
    EXPECT_DOUBLE_EQ(msg.h().item()(0), 0.0);
}

TEST(ConditionedLinearSDE, BackwardMessage) {
    const double y = 2.0;
    auto bm = std::make_shared<BrownianMotion>(1.0, 1);
    auto conditioned = bm->condition_on(scalar_evidence({1.0}, {y}, {1.0}));

    // y | x_0 ~ N(x_0, 2)
    const auto msg = conditioned->backward_message(0.0);
    EXPECT_NEAR(scalar(msg.J()), 0.5, 1e-12);
    EXPECT_NEAR(msg.h().item()(0), 0.5 * y, 1e-12);

    // At the evidence time the message is the potential itself.
    const auto at = conditioned->backward_message(1.0);
    EXPECT_NEAR(scalar(at.J()), 1.0, 1e-12);
    EXPECT_NEAR(at.h().item()(0), y, 1e-12);
}

TEST(ConditionedLinearSDE, BridgeParams) {
    const double y = 2.0;
    auto bm = std::make_shared<BrownianMotion>(1.0, 1);
    auto conditioned = bm->condition_on(scalar_evidence({1.0}, {y}, {1.0}));

    const auto p = conditioned->get_params(0.0);
    EXPECT_NEAR(scalar(p.F), -0.5, 1e-12);
    EXPECT_NEAR(p.u.item()(0), 0.5 * y, 1e-12);
    EXPECT_NEAR(scalar(p.L), 1.0, 1e-12);

    const auto drift = conditioned->get_drift(0.0, scalar_vector(1.0));
    EXPECT_NEAR(drift.item()(0), -0.5 + 0.5 * y, 1e-12);

    // Past the evidence the drift is the base drift.
    const auto late = conditioned->get_params(2.0);
    EXPECT_NEAR(scalar(late.F), 0.0, 1e-14);
    EXPECT_NEAR(late.u.item()(0), 0.0, 1e-14);
}

TEST(ConditionedLinearSDE, MarkovAcrossEvidence) {
    auto bm = std::make_shared<BrownianMotion>(0.8, 1);
    auto conditioned = bm->condition_on(scalar_evidence({0.5, 1.0}, {1.0, -1.0}, {4.0, 2.0}));

    const auto direct = conditioned->get_transition_distribution(0.0, 1.2);
    const auto chained = conditioned->get_transition_distribution(0.0, 0.7)
        .chain(conditioned->get_transition_distribution(0.7, 1.2));

    EXPECT_NEAR(scalar(chained.A()), scalar(direct.A()), 1e-12);
    EXPECT_NEAR(chained.u().item()(0), direct.u().item()(0), 1e-12);
    EXPECT_NEAR(scalar(chained.Sigma()), scalar(direct.Sigma()), 1e-12);
}

TEST(ConditionedLinearSDE, DenseModelMatchesJointGaussian) {
    auto wv = std::make_shared<WienerVelocityModel>(1.0, 1);

    Eigen::VectorXd y1(2), y2(2);
    y1 << 1.0, 0.0;
    y2 << 2.0, 1.0;
    Eigen::MatrixXd J1 = Eigen::Vector2d(4.0, 1.0).asDiagonal();
    Eigen::MatrixXd J2 = Eigen::Vector2d(1.0, 2.0).asDiagonal();
    const double tau1 = 0.5;
    const double tau2 = 1.5;

    auto evidence = std::make_shared<GaussianPotentialSeries>(
        std::vector<double>{tau1, tau2},
        std::vector<MixedGaussian>{
            MixedGaussian(y1, DenseMatrix(J1, Tags::psd())),
            MixedGaussian(y2, DenseMatrix(J2, Tags::psd()))});
    auto conditioned = wv->condition_on(evidence);

    Eigen::VectorXd x0(2);
    x0 << 0.3, -0.2;

    for (double t : {1.0, 2.0}) {
        const auto posterior = conditioned->get_transition_distribution(0.0, t).condition_on_x(x0);

        // Joint law of (x_t, x_tau1, x_tau2) given x_0, then condition on both observations.
        const std::vector<double> times{t, tau1, tau2};
        Eigen::VectorXd mean(6);
        Eigen::MatrixXd cov(6, 6);
        for (int i = 0; i < 3; ++i) {
            mean.segment(2 * i, 2) = cv_A(times[i]) * x0;
            for (int j = 0; j < 3; ++j) {
                cov.block(2 * i, 2 * j, 2, 2) = cv_cross(times[i], times[j]);
            }
        }
        Eigen::MatrixXd R = Eigen::MatrixXd::Zero(4, 4);
        R.topLeftCorner(2, 2) = J1.inverse();
        R.bottomRightCorner(2, 2) = J2.inverse();
        Eigen::VectorXd y(4);
        y << y1, y2;

        const Eigen::MatrixXd Syy = cov.bottomRightCorner(4, 4) + R;
        const Eigen::MatrixXd Sxy = cov.topRightCorner(2, 4);
        const Eigen::MatrixXd K = Sxy * Syy.inverse();
        const Eigen::VectorXd expected_mean = mean.head(2) + K * (y - mean.tail(4));
        const Eigen::MatrixXd expected_cov = cov.topLeftCorner(2, 2) - K * Sxy.transpose();

        EXPECT_TRUE(posterior.mu().item().isApprox(expected_mean, 1e-8)) << "t = " << t;
        EXPECT_TRUE(posterior.Sigma().as_matrix().isApprox(expected_cov, 1e-8)) << "t = " << t;
    }
}

TEST(ConditionedLinearSDE, ForwardsModelAttributes) {
    auto wv = std::make_shared<WienerVelocityModel>(1.0, 1, 3);
    auto evidence = std::make_shared<GaussianPotentialSeries>(GaussianPotentialSeries::single(
        1.0, MixedGaussian(zero_vector(3), Matrix::eye(3))));
    auto conditioned = wv->condition_on(evidence);

    EXPECT_EQ(conditioned->dim(), 3);
    EXPECT_EQ(conditioned->order(), 3);
    EXPECT_FALSE(conditioned->batch_size().has_value());
    EXPECT_EQ(conditioned->name(), "ConditionedLinearSDE(WienerVelocityModel, 1 potentials)");
}

TEST(ConditionedLinearSDE, BatchedEvidence) {
    auto bm = std::make_shared<BrownianMotion>(1.0, 1);
    auto evidence = std::make_shared<GaussianPotentialSeries>(GaussianPotentialSeries::single(
        1.0, MixedGaussian(VectorBatch::stacked({scalar_vector(-1.0), scalar_vector(0.0), scalar_vector(3.0)}),
                           precision(1.0))));
    auto conditioned = bm->condition_on(evidence);
    EXPECT_EQ(conditioned->batch_size(), BatchSize(3));

    const auto t = conditioned->get_transition_distribution(0.0, 1.0);
    EXPECT_EQ(t.batch_size(), BatchSize(3));
    EXPECT_NEAR(t.u()[2](0), 1.5, 1e-12);
    EXPECT_NEAR(t.u()[0](0), -0.5, 1e-12);
}

TEST(ConditionedLinearSDE, RejectsBadInputs) {
    auto bm = std::make_shared<BrownianMotion>(1.0, 2);
    auto evidence = scalar_evidence({1.0}, {0.0}, {1.0});

    EXPECT_THROW(ConditionedLinearSDE(bm, evidence), ShapeMismatchError);
    EXPECT_THROW(ConditionedLinearSDE(nullptr, evidence), std::invalid_argument);
    EXPECT_THROW(ConditionedLinearSDE(bm, nullptr), std::invalid_argument);

    auto bm1 = std::make_shared<BrownianMotion>(1.0, 1);
    auto conditioned = bm1->condition_on(evidence);
    EXPECT_THROW((void)conditioned->get_transition_distribution(1.0, 0.0), std::invalid_argument);
}
