#pragma once

#include "linsde/sde/linear_time_invariant_sde.hpp"

namespace linsde::sde {

/// Integrated Wiener process of a given order.
/// State = [x, x', ..., x^(order-1)], each block of size position_dim. The highest
/// derivative is driven by sigma dW; every other block integrates the next one.
/// order = 2 is the constant-velocity model, order = 3 constant acceleration.
class WienerVelocityModel : public LinearTimeInvariantSDE {
public:
    WienerVelocityModel(double sigma, Eigen::Index position_dim, int order = 2);

    [[nodiscard]] std::string name() const override { return "WienerVelocityModel"; }
    [[nodiscard]] std::optional<int> get_order() const override { return order_; }

    [[nodiscard]] double sigma() const { return sigma_; }
    [[nodiscard]] Eigen::Index position_dim() const { return position_dim_; }

private:
    double sigma_;
    Eigen::Index position_dim_;
    int order_;
};

} // namespace linsde::sde
