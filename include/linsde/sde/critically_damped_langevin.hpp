#pragma once

#include "linsde/sde/linear_time_invariant_sde.hpp"
#include <cmath>

namespace linsde::sde {

/// Critically-damped Langevin dynamics on state [x, v]:
///   dx = beta v / M dt
///   dv = -beta x dt - beta Gamma v / M dt + sqrt(2 Gamma beta) dW,  Gamma = 2 sqrt(M).
class CriticallyDampedLangevinDynamics : public LinearTimeInvariantSDE {
public:
    CriticallyDampedLangevinDynamics(double mass, double beta, Eigen::Index dim);

    [[nodiscard]] std::string name() const override { return "CriticallyDampedLangevinDynamics"; }

    [[nodiscard]] double mass() const { return mass_; }
    [[nodiscard]] double beta() const { return beta_; }
    [[nodiscard]] double gamma() const { return 2.0 * std::sqrt(mass_); }

private:
    double mass_;
    double beta_;
};

} // namespace linsde::sde
