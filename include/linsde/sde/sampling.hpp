#pragma once

#include "linsde/sde/sde_base.hpp"
#include <EigenRand/EigenRand>
#include <vector>

namespace linsde::sde {

using Rng = Eigen::Rand::Vmt19937_64;

/// Draw one path of an unbatched linear SDE at the given times, starting from
/// x0 at times[0]. Each step is drawn from the exact transition distribution.
/// Row k of the result is the state at times[k].
[[nodiscard]] Eigen::MatrixXd sample_path(
    const AbstractLinearSDE& sde,
    const Eigen::VectorXd& x0,
    const std::vector<double>& times,
    Rng& rng);

/// Draw x ~ N(mean, cov); cov may be singular.
[[nodiscard]] Eigen::VectorXd sample_gaussian(
    const Eigen::VectorXd& mean,
    const Eigen::MatrixXd& cov,
    Rng& rng);

} // namespace linsde::sde
