#pragma once

#include "linsde/matrix/matrix.hpp"
#include "linsde/potential/potential_series.hpp"
#include "linsde/potential/transition.hpp"
#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <string>

namespace linsde::sde {

class ConditionedLinearSDE;

/// Abstract base class for SDEs dx = f(x, t) dt + L(t, x) dW.
/// Models are immutable and shared through std::shared_ptr<const ...>.
class AbstractSDE : public std::enable_shared_from_this<AbstractSDE> {
public:
    virtual ~AbstractSDE() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    /// Dimension of the state.
    [[nodiscard]] virtual Eigen::Index dim() const = 0;

    /// Leading batch axis shared by the model parameters; empty when unbatched.
    [[nodiscard]] virtual matrix::BatchSize batch_size() const = 0;

    /// Drift f(x, t).
    [[nodiscard]] virtual matrix::VectorBatch get_drift(
        double t,
        const matrix::VectorBatch& x) const = 0;

    /// Diffusion coefficient L(t, x).
    [[nodiscard]] virtual matrix::Matrix get_diffusion_coefficient(
        double t,
        const matrix::VectorBatch& x) const = 0;

    /// Number of stacked derivatives in the state, for models that have one.
    [[nodiscard]] virtual std::optional<int> get_order() const { return std::nullopt; }

    /// Like get_order(), but throws MissingAttributeError when the model has no order.
    [[nodiscard]] int order() const;

protected:
    AbstractSDE() = default;
    AbstractSDE(const AbstractSDE&) = default;
    AbstractSDE& operator=(const AbstractSDE&) = default;
};

/// Parameters of the linear SDE dx = (F x + u) dt + L dW at one time.
struct LinearSDEParams {
    matrix::Matrix F;
    matrix::VectorBatch u;
    matrix::Matrix L;
};

/// Abstract base for linear SDEs. F(t), u(t) and L(t) may vary in time, so
/// subclasses supply the transition distribution themselves.
class AbstractLinearSDE : public AbstractSDE {
public:
    [[nodiscard]] virtual LinearSDEParams get_params(double t) const = 0;

    /// Gaussian law of x_t given x_s, for s <= t.
    [[nodiscard]] virtual potential::GaussianTransition get_transition_distribution(
        double s, double t) const = 0;

    [[nodiscard]] matrix::VectorBatch get_drift(
        double t,
        const matrix::VectorBatch& x) const override;

    [[nodiscard]] matrix::Matrix get_diffusion_coefficient(
        double t,
        const matrix::VectorBatch& x) const override;

    /// Condition this SDE on evidence. The result shares ownership of this
    /// model and of the evidence; nothing is computed until it is queried.
    /// This model must be owned by a std::shared_ptr.
    [[nodiscard]] std::shared_ptr<const ConditionedLinearSDE> condition_on(
        std::shared_ptr<const potential::GaussianPotentialSeries> evidence) const;
};

/// Abstract base for linear time-invariant SDEs: constant F and L, u = 0.
/// Transitions are computed in closed form.
class AbstractLinearTimeInvariantSDE : public AbstractLinearSDE {
public:
    [[nodiscard]] virtual const matrix::Matrix& F() const = 0;
    [[nodiscard]] virtual const matrix::Matrix& L() const = 0;

    [[nodiscard]] Eigen::Index dim() const override { return F().rows(); }

    /// Shared batch size of F and L; throws BatchMismatchError when they disagree.
    [[nodiscard]] matrix::BatchSize batch_size() const override;

    [[nodiscard]] LinearSDEParams get_params(double t) const override;

    /// A = exp(F dt), u = 0, Sigma = int_0^dt exp(F r) L L^T exp(F^T r) dr.
    [[nodiscard]] potential::GaussianTransition get_transition_distribution(
        double s, double t) const override;
};

/// Runs a base LTI SDE at a different rate: F' = k F, L' = sqrt(k) L.
/// The transition over (s, t) is the base transition over (k s, k t).
class TimeScaledLinearTimeInvariantSDE : public AbstractLinearTimeInvariantSDE {
public:
    TimeScaledLinearTimeInvariantSDE(
        std::shared_ptr<const AbstractLinearTimeInvariantSDE> sde,
        double time_scale);

    [[nodiscard]] const std::shared_ptr<const AbstractLinearTimeInvariantSDE>& sde() const { return sde_; }
    [[nodiscard]] double time_scale() const { return time_scale_; }

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] const matrix::Matrix& F() const override { return F_; }
    [[nodiscard]] const matrix::Matrix& L() const override { return L_; }

    [[nodiscard]] potential::GaussianTransition get_transition_distribution(
        double s, double t) const override;

    [[nodiscard]] std::optional<int> get_order() const override { return sde_->get_order(); }

private:
    std::shared_ptr<const AbstractLinearTimeInvariantSDE> sde_;
    double time_scale_;
    matrix::Matrix F_;
    matrix::Matrix L_;
};

/// Throws std::invalid_argument unless s <= t.
void check_time_order(double s, double t, const char* where);

} // namespace linsde::sde
