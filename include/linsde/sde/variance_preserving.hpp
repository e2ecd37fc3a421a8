#pragma once

#include "linsde/sde/sde_base.hpp"

namespace linsde::sde {

/// Variance-preserving SDE with linear noise schedule
/// beta(t) = beta_min + t (beta_max - beta_min):
///   dx = -beta(t) x / 2 dt + sqrt(beta(t)) dW.
/// Time-varying, but the transition has a closed form. Defined for t >= 0; earlier
/// times throw std::invalid_argument.
class VariancePreserving : public AbstractLinearSDE {
public:
    VariancePreserving(double beta_min, double beta_max, Eigen::Index dim);

    [[nodiscard]] std::string name() const override { return "VariancePreserving"; }
    [[nodiscard]] Eigen::Index dim() const override { return dim_; }
    [[nodiscard]] matrix::BatchSize batch_size() const override { return std::nullopt; }

    [[nodiscard]] double beta(double t) const { return beta_min_ + t * (beta_max_ - beta_min_); }

    /// Integral of beta over [s, t].
    [[nodiscard]] double integrated_beta(double s, double t) const;

    [[nodiscard]] LinearSDEParams get_params(double t) const override;

    [[nodiscard]] potential::GaussianTransition get_transition_distribution(
        double s, double t) const override;

private:
    double beta_min_;
    double beta_max_;
    Eigen::Index dim_;
};

} // namespace linsde::sde
