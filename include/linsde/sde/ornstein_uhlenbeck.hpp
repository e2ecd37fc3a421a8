#pragma once

#include "linsde/sde/linear_time_invariant_sde.hpp"

namespace linsde::sde {

/// Ornstein-Uhlenbeck process dx = -lambda x dt + sigma dW (diagonal F and L).
class OrnsteinUhlenbeck : public LinearTimeInvariantSDE {
public:
    OrnsteinUhlenbeck(double sigma, double lambda, Eigen::Index dim);

    [[nodiscard]] std::string name() const override { return "OrnsteinUhlenbeck"; }
    [[nodiscard]] double sigma() const { return sigma_; }
    [[nodiscard]] double lambda() const { return lambda_; }

private:
    double sigma_;
    double lambda_;
};

} // namespace linsde::sde
