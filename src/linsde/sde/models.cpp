#include "linsde/sde/brownian_motion.hpp"
#include "linsde/sde/critically_damped_langevin.hpp"
#include "linsde/sde/ornstein_uhlenbeck.hpp"
#include "linsde/sde/wiener_velocity_model.hpp"
#include <cmath>
#include <fmt/format.h>

namespace linsde::sde {

using matrix::DenseMatrix;
using matrix::DiagonalMatrix;
using matrix::Tags;

namespace {

Eigen::Index checked_dim(Eigen::Index dim, const char* where) {
    if (dim < 1) {
        throw std::invalid_argument(fmt::format("{}: dimension must be at least 1, got {}", where, dim));
    }
    return dim;
}

double checked_positive(double value, const char* what, const char* where) {
    if (!(value > 0.0) || !std::isfinite(value)) {
        throw std::invalid_argument(fmt::format("{}: {} must be positive, got {}", where, what, value));
    }
    return value;
}

int checked_order(int order) {
    if (order < 1) {
        throw std::invalid_argument(fmt::format("WienerVelocityModel: order must be at least 1, got {}", order));
    }
    return order;
}

DiagonalMatrix constant_diagonal(double value, Eigen::Index dim, const char* where) {
    return DiagonalMatrix(Eigen::VectorXd(Eigen::VectorXd::Constant(checked_dim(dim, where), value)),
                          Tags::no_tags());
}

Eigen::MatrixXd wiener_velocity_drift(Eigen::Index position_dim, int order) {
    const Eigen::Index p = checked_dim(position_dim, "WienerVelocityModel");
    const Eigen::Index D = p * checked_order(order);
    Eigen::MatrixXd F = Eigen::MatrixXd::Zero(D, D);
    for (int k = 0; k + 1 < order; ++k) {
        F.block(k * p, (k + 1) * p, p, p).setIdentity();
    }
    return F;
}

Eigen::MatrixXd wiener_velocity_diffusion(double sigma, Eigen::Index position_dim, int order) {
    const Eigen::Index p = checked_dim(position_dim, "WienerVelocityModel");
    const Eigen::Index D = p * checked_order(order);
    Eigen::MatrixXd L = Eigen::MatrixXd::Zero(D, D);
    L.bottomRightCorner(p, p) = sigma * Eigen::MatrixXd::Identity(p, p);
    return L;
}

// State [x, v]: dx = beta v / M, dv = -beta x - beta Gamma v / M.
Eigen::MatrixXd langevin_drift(double mass, double beta, Eigen::Index dim) {
    const Eigen::Index p = checked_dim(dim, "CriticallyDampedLangevinDynamics");
    const Eigen::MatrixXd I = Eigen::MatrixXd::Identity(p, p);
    const double Gamma = 2.0 * std::sqrt(mass);
    Eigen::MatrixXd F = Eigen::MatrixXd::Zero(2 * p, 2 * p);
    F.topRightCorner(p, p) = (beta / mass) * I;
    F.bottomLeftCorner(p, p) = -beta * I;
    F.bottomRightCorner(p, p) = -(beta * Gamma / mass) * I;
    return F;
}

Eigen::MatrixXd langevin_diffusion(double mass, double beta, Eigen::Index dim) {
    const Eigen::Index p = checked_dim(dim, "CriticallyDampedLangevinDynamics");
    const double Gamma = 2.0 * std::sqrt(mass);
    Eigen::MatrixXd L = Eigen::MatrixXd::Zero(2 * p, 2 * p);
    L.bottomRightCorner(p, p) = std::sqrt(2.0 * Gamma * beta) * Eigen::MatrixXd::Identity(p, p);
    return L;
}

} // namespace

// ---- BrownianMotion ----

BrownianMotion::BrownianMotion(double sigma, Eigen::Index dim)
    : LinearTimeInvariantSDE(
          constant_diagonal(0.0, dim, "BrownianMotion"),
          constant_diagonal(checked_positive(sigma, "sigma", "BrownianMotion"), dim, "BrownianMotion")),
      sigma_(sigma) {}

// ---- OrnsteinUhlenbeck ----

OrnsteinUhlenbeck::OrnsteinUhlenbeck(double sigma, double lambda, Eigen::Index dim)
    : LinearTimeInvariantSDE(
          constant_diagonal(-lambda, dim, "OrnsteinUhlenbeck"),
          constant_diagonal(checked_positive(sigma, "sigma", "OrnsteinUhlenbeck"), dim, "OrnsteinUhlenbeck")),
      sigma_(sigma),
      lambda_(lambda) {}

// ---- WienerVelocityModel ----

WienerVelocityModel::WienerVelocityModel(double sigma, Eigen::Index position_dim, int order)
    : LinearTimeInvariantSDE(
          DenseMatrix(wiener_velocity_drift(position_dim, order)),
          DenseMatrix(wiener_velocity_diffusion(checked_positive(sigma, "sigma", "WienerVelocityModel"),
                                                position_dim, order))),
      sigma_(sigma),
      position_dim_(position_dim),
      order_(order) {}

// ---- CriticallyDampedLangevinDynamics ----

CriticallyDampedLangevinDynamics::CriticallyDampedLangevinDynamics(double mass, double beta, Eigen::Index dim)
    : LinearTimeInvariantSDE(
          DenseMatrix(langevin_drift(checked_positive(mass, "mass", "CriticallyDampedLangevinDynamics"),
                                     checked_positive(beta, "beta", "CriticallyDampedLangevinDynamics"), dim)),
          DenseMatrix(langevin_diffusion(mass, beta, dim))),
      mass_(mass),
      beta_(beta) {}

} // namespace linsde::sde
