#pragma once

#include "linsde/potential/gaussian.hpp"
#include "linsde/potential/potential_series.hpp"
#include "linsde/sde/sde_base.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace linsde::sde {

/// A linear SDE conditioned on evidence (Doob h-transform).
///
/// Holds the base SDE and the evidence by shared ownership. Nothing is
/// precomputed: every query runs backward messages over the evidence that lies
/// after the query time. Transitions are p(x_t | x_s, all evidence after s).
class ConditionedLinearSDE : public AbstractLinearSDE {
public:
    ConditionedLinearSDE(
        std::shared_ptr<const AbstractLinearSDE> sde,
        std::shared_ptr<const potential::GaussianPotentialSeries> evidence);

    [[nodiscard]] const std::shared_ptr<const AbstractLinearSDE>& sde() const { return sde_; }
    [[nodiscard]] const std::shared_ptr<const potential::GaussianPotentialSeries>& evidence() const {
        return evidence_;
    }

    [[nodiscard]] std::string name() const override;
    [[nodiscard]] Eigen::Index dim() const override { return sde_->dim(); }
    [[nodiscard]] matrix::BatchSize batch_size() const override { return batch_size_; }
    [[nodiscard]] std::optional<int> get_order() const override { return sde_->get_order(); }

    /// Drift F - L L^T J_t, offset u + L L^T h_t, where (J_t, h_t) = backward_message(t).
    [[nodiscard]] LinearSDEParams get_params(double t) const override;

    [[nodiscard]] potential::GaussianTransition get_transition_distribution(
        double s, double t) const override;

    /// Likelihood of the evidence at times >= t as a potential on x_t.
    [[nodiscard]] potential::NaturalGaussian backward_message(double t) const;

private:
    std::shared_ptr<const AbstractLinearSDE> sde_;
    std::shared_ptr<const potential::GaussianPotentialSeries> evidence_;
    matrix::BatchSize batch_size_;
};

} // namespace linsde::sde
