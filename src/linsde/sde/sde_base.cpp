#include "linsde/sde/sde_base.hpp"
#include "linsde/sde/conditioned_linear_sde.hpp"
#include <cmath>
#include <fmt/format.h>
#include <unsupported/Eigen/MatrixFunctions>

namespace linsde::sde {

using matrix::Matrix;
using matrix::Tags;
using matrix::VectorBatch;
using potential::GaussianTransition;

namespace {

/// Process noise when F and L are both diagonal: each coordinate is a scalar OU process.
Matrix diagonal_process_noise(const matrix::DiagonalMatrix& F, const matrix::DiagonalMatrix& L, double dt) {
    return matrix::DiagonalMatrix(
        matrix::zip(F.diagonal(), L.diagonal(),
            [dt](const Eigen::VectorXd& f, const Eigen::VectorXd& l) -> Eigen::VectorXd {
                Eigen::VectorXd out(f.size());
                for (Eigen::Index i = 0; i < f.size(); ++i) {
                    const double q = l(i) * l(i);
                    out(i) = (f(i) == 0.0) ? q * dt : q * std::expm1(2.0 * f(i) * dt) / (2.0 * f(i));
                }
                return out;
            }, "diagonal_process_noise"),
        Tags::psd());
}

/// Van Loan's method: exp([[-F, L L^T], [0, F^T]] h) = [[., G12], [0, G22]],
/// exp(F h) = G22^T and Sigma(h) = G22^T G12.
/// exp(-F h) overflows for stable F and long h, so the block exponential is only taken
/// over h = dt / 2^k with |F| h <= 1, then doubled k times:
/// Sigma(2h) = Phi(h) Sigma(h) Phi(h)^T + Sigma(h), Phi(2h) = Phi(h)^2.
Eigen::MatrixXd van_loan(const Eigen::MatrixXd& Fm, const Eigen::MatrixXd& Qm, double dt) {
    const Eigen::Index n = Fm.rows();
    const double norm = (n == 0) ? 0.0 : Fm.cwiseAbs().rowwise().sum().maxCoeff();

    int squarings = 0;
    double h = dt;
    while (norm * h > 1.0 && squarings < 64) {
        h *= 0.5;
        ++squarings;
    }

    Eigen::MatrixXd M = Eigen::MatrixXd::Zero(2 * n, 2 * n);
    M.topLeftCorner(n, n) = -Fm * h;
    M.topRightCorner(n, n) = Qm * h;
    M.bottomRightCorner(n, n) = Fm.transpose() * h;
    const Eigen::MatrixXd E = M.exp();
    Eigen::MatrixXd Phi = E.bottomRightCorner(n, n).transpose();
    Eigen::MatrixXd S = Phi * E.topRightCorner(n, n);

    for (int k = 0; k < squarings; ++k) {
        S = (Phi * S * Phi.transpose() + S).eval();
        Phi = (Phi * Phi).eval();
    }
    return 0.5 * (S + S.transpose());
}

Matrix van_loan_process_noise(const Matrix& F, const Matrix& L, double dt) {
    const Matrix Q = L * L.transpose();
    return matrix::DenseMatrix(
        matrix::zip(F.to_dense(), Q.to_dense(),
            [dt](const Eigen::MatrixXd& Fm, const Eigen::MatrixXd& Qm) -> Eigen::MatrixXd {
                return van_loan(Fm, Qm, dt);
            }, "van_loan_process_noise"),
        Tags::psd());
}

const AbstractLinearTimeInvariantSDE& checked_base(
    const std::shared_ptr<const AbstractLinearTimeInvariantSDE>& sde, double time_scale) {
    if (!sde) {
        throw std::invalid_argument("TimeScaledLinearTimeInvariantSDE: base SDE is null");
    }
    if (!(time_scale > 0.0) || !std::isfinite(time_scale)) {
        throw std::invalid_argument(fmt::format(
            "TimeScaledLinearTimeInvariantSDE: time_scale must be positive and finite, got {}", time_scale));
    }
    return *sde;
}

} // namespace

void check_time_order(double s, double t, const char* where) {
    if (!(s <= t)) {
        throw std::invalid_argument(fmt::format("{}: expected s <= t, got s = {}, t = {}", where, s, t));
    }
}

// ---- AbstractSDE ----

int AbstractSDE::order() const {
    if (const auto o = get_order()) {
        return *o;
    }
    throw MissingAttributeError(fmt::format("{} does not have an order", name()));
}

// ---- AbstractLinearSDE ----

VectorBatch AbstractLinearSDE::get_drift(double t, const VectorBatch& x) const {
    const LinearSDEParams p = get_params(t);
    return p.F * x + p.u;
}

Matrix AbstractLinearSDE::get_diffusion_coefficient(double t, const VectorBatch& /*x*/) const {
    return get_params(t).L;
}

std::shared_ptr<const ConditionedLinearSDE> AbstractLinearSDE::condition_on(
    std::shared_ptr<const potential::GaussianPotentialSeries> evidence) const {

    auto self = std::static_pointer_cast<const AbstractLinearSDE>(weak_from_this().lock());
    if (!self) {
        throw std::logic_error(fmt::format(
            "{}: condition_on requires the model to be owned by a std::shared_ptr", name()));
    }
    return std::make_shared<ConditionedLinearSDE>(std::move(self), std::move(evidence));
}

// ---- AbstractLinearTimeInvariantSDE ----

matrix::BatchSize AbstractLinearTimeInvariantSDE::batch_size() const {
    return matrix::broadcast_batch_size(F().batch_size(), L().batch_size(), "LinearTimeInvariantSDE");
}

LinearSDEParams AbstractLinearTimeInvariantSDE::get_params(double /*t*/) const {
    return LinearSDEParams{F(), matrix::zero_vector(dim()), L()};
}

GaussianTransition AbstractLinearTimeInvariantSDE::get_transition_distribution(double s, double t) const {
    check_time_order(s, t, "get_transition_distribution");
    const double dt = t - s;
    const Matrix& F = this->F();
    const Matrix& L = this->L();

    const Matrix A = F.scaled(dt).exp().with_tags(F.tags());

    const auto* F_diag = F.as<matrix::DiagonalMatrix>();
    const auto* L_diag = L.as<matrix::DiagonalMatrix>();
    const Matrix Sigma = (F_diag && L_diag)
        ? diagonal_process_noise(*F_diag, *L_diag, dt)
        : van_loan_process_noise(F, L, dt);

    return GaussianTransition(A, matrix::zero_vector(dim()), Sigma);
}

// ---- TimeScaledLinearTimeInvariantSDE ----

TimeScaledLinearTimeInvariantSDE::TimeScaledLinearTimeInvariantSDE(
    std::shared_ptr<const AbstractLinearTimeInvariantSDE> sde,
    double time_scale)
    : sde_(std::move(sde)),
      time_scale_(time_scale),
      F_(checked_base(sde_, time_scale).F().scaled(time_scale)),
      L_(sde_->L().scaled(std::sqrt(time_scale))) {}

std::string TimeScaledLinearTimeInvariantSDE::name() const {
    return fmt::format("TimeScaledLinearTimeInvariantSDE({})", sde_->name());
}

GaussianTransition TimeScaledLinearTimeInvariantSDE::get_transition_distribution(double s, double t) const {
    return sde_->get_transition_distribution(s * time_scale_, t * time_scale_);
}

} // namespace linsde::sde
