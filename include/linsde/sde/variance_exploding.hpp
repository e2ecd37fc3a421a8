#pragma once

#include "linsde/sde/sde_base.hpp"

namespace linsde::sde {

/// Variance-exploding SDE dx = g(t) dW with geometric noise schedule
/// sigma(t) = sigma_min (sigma_max / sigma_min)^t and g(t)^2 = d sigma(t)^2 / dt.
class VarianceExploding : public AbstractLinearSDE {
public:
    VarianceExploding(double sigma_min, double sigma_max, Eigen::Index dim);

    [[nodiscard]] std::string name() const override { return "VarianceExploding"; }
    [[nodiscard]] Eigen::Index dim() const override { return dim_; }
    [[nodiscard]] matrix::BatchSize batch_size() const override { return std::nullopt; }

    [[nodiscard]] double sigma(double t) const;

    [[nodiscard]] LinearSDEParams get_params(double t) const override;

    [[nodiscard]] potential::GaussianTransition get_transition_distribution(
        double s, double t) const override;

private:
    double sigma_min_;
    double sigma_max_;
    Eigen::Index dim_;
};

} // namespace linsde::sde
