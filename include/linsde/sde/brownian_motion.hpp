#pragma once

#include "linsde/sde/linear_time_invariant_sde.hpp"

namespace linsde::sde {

/// Brownian motion dx = sigma dW: F = 0, L = sigma I (both diagonal).
/// Transition over dt: A = I, u = 0, Sigma = sigma^2 dt I.
class BrownianMotion : public LinearTimeInvariantSDE {
public:
    BrownianMotion(double sigma, Eigen::Index dim);

    [[nodiscard]] std::string name() const override { return "BrownianMotion"; }
    [[nodiscard]] double sigma() const { return sigma_; }

private:
    double sigma_;
};

} // namespace linsde::sde
