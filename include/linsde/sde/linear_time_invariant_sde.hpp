#pragma once

#include "linsde/sde/sde_base.hpp"

namespace linsde::sde {

/// LTI SDE dx = F x dt + L dW with user-supplied F and L.
/// F must be square, L must have as many rows as F, and their batch sizes must agree.
class LinearTimeInvariantSDE : public AbstractLinearTimeInvariantSDE {
public:
    LinearTimeInvariantSDE(matrix::Matrix F, matrix::Matrix L);

    [[nodiscard]] std::string name() const override { return "LinearTimeInvariantSDE"; }

    [[nodiscard]] const matrix::Matrix& F() const override { return F_; }
    [[nodiscard]] const matrix::Matrix& L() const override { return L_; }

protected:
    matrix::Matrix F_;
    matrix::Matrix L_;
};

} // namespace linsde::sde
