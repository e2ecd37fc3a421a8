#include "linsde/sde/variance_exploding.hpp"
#include "linsde/sde/variance_preserving.hpp"
#include <cmath>
#include <fmt/format.h>

namespace linsde::sde {

using matrix::DiagonalMatrix;
using matrix::Tags;
using potential::GaussianTransition;

namespace {

void check_schedule_time(double t, const char* where) {
    if (!(t >= 0.0)) {
        throw std::invalid_argument(fmt::format("{}: the noise schedule starts at t = 0, got t = {}", where, t));
    }
}

DiagonalMatrix scalar_identity(double value, Eigen::Index dim, Tags tags = Tags::no_tags()) {
    return DiagonalMatrix(Eigen::VectorXd(Eigen::VectorXd::Constant(dim, value)), tags);
}

} // namespace

// ---- VariancePreserving ----

VariancePreserving::VariancePreserving(double beta_min, double beta_max, Eigen::Index dim)
    : beta_min_(beta_min), beta_max_(beta_max), dim_(dim) {
    if (!(beta_min_ >= 0.0) || !(beta_max_ >= beta_min_)) {
        throw std::invalid_argument(fmt::format(
            "VariancePreserving: need 0 <= beta_min <= beta_max, got {} and {}", beta_min_, beta_max_));
    }
    if (dim_ < 1) {
        throw std::invalid_argument(fmt::format("VariancePreserving: dimension must be at least 1, got {}", dim_));
    }
}

double VariancePreserving::integrated_beta(double s, double t) const {
    return beta_min_ * (t - s) + 0.5 * (beta_max_ - beta_min_) * (t * t - s * s);
}

LinearSDEParams VariancePreserving::get_params(double t) const {
    check_schedule_time(t, "VariancePreserving::get_params");
    const double b = beta(t);
    return LinearSDEParams{
        scalar_identity(-0.5 * b, dim_),
        matrix::zero_vector(dim_),
        scalar_identity(std::sqrt(b), dim_)
    };
}

GaussianTransition VariancePreserving::get_transition_distribution(double s, double t) const {
    check_time_order(s, t, "VariancePreserving::get_transition_distribution");
    check_schedule_time(s, "VariancePreserving::get_transition_distribution");
    const double B = integrated_beta(s, t);
    return GaussianTransition(
        scalar_identity(std::exp(-0.5 * B), dim_),
        matrix::zero_vector(dim_),
        scalar_identity(-std::expm1(-B), dim_, Tags::psd()));
}

// ---- VarianceExploding ----

VarianceExploding::VarianceExploding(double sigma_min, double sigma_max, Eigen::Index dim)
    : sigma_min_(sigma_min), sigma_max_(sigma_max), dim_(dim) {
    if (!(sigma_min_ > 0.0) || !(sigma_max_ > sigma_min_)) {
        throw std::invalid_argument(fmt::format(
            "VarianceExploding: need 0 < sigma_min < sigma_max, got {} and {}", sigma_min_, sigma_max_));
    }
    if (dim_ < 1) {
        throw std::invalid_argument(fmt::format("VarianceExploding: dimension must be at least 1, got {}", dim_));
    }
}

double VarianceExploding::sigma(double t) const {
    return sigma_min_ * std::pow(sigma_max_ / sigma_min_, t);
}

LinearSDEParams VarianceExploding::get_params(double t) const {
    const double g = sigma(t) * std::sqrt(2.0 * std::log(sigma_max_ / sigma_min_));
    return LinearSDEParams{
        scalar_identity(0.0, dim_),
        matrix::zero_vector(dim_),
        scalar_identity(g, dim_)
    };
}

GaussianTransition VarianceExploding::get_transition_distribution(double s, double t) const {
    check_time_order(s, t, "VarianceExploding::get_transition_distribution");
    const double ss = sigma(s);
    const double st = sigma(t);
    return GaussianTransition(
        scalar_identity(1.0, dim_),
        matrix::zero_vector(dim_),
        scalar_identity(st * st - ss * ss, dim_, Tags::psd()));
}

} // namespace linsde::sde
