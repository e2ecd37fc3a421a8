#include "linsde/sde/sampling.hpp"
#include <fmt/format.h>

namespace linsde::sde {

Eigen::VectorXd sample_gaussian(const Eigen::VectorXd& mean, const Eigen::MatrixXd& cov, Rng& rng) {
    // Eigendecomposition rather than Cholesky so zero-variance directions are allowed.
    const Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eig(cov);
    const Eigen::VectorXd scale = eig.eigenvalues().cwiseMax(0.0).cwiseSqrt();
    const Eigen::MatrixXd z = Eigen::Rand::normal<Eigen::MatrixXd>(mean.size(), 1, rng);
    return mean + eig.eigenvectors() * scale.asDiagonal() * z.col(0);
}

Eigen::MatrixXd sample_path(
    const AbstractLinearSDE& sde,
    const Eigen::VectorXd& x0,
    const std::vector<double>& times,
    Rng& rng) {

    if (sde.batch_size()) {
        throw BatchMismatchError(fmt::format("sample_path: {} is batched", sde.name()));
    }
    if (x0.size() != sde.dim()) {
        throw ShapeMismatchError(fmt::format(
            "sample_path: initial state of length {} for {} of dimension {}", x0.size(), sde.name(), sde.dim()));
    }
    if (times.empty()) {
        throw std::invalid_argument("sample_path: no times given");
    }

    Eigen::MatrixXd path(static_cast<Eigen::Index>(times.size()), sde.dim());
    path.row(0) = x0.transpose();
    Eigen::VectorXd x = x0;
    for (std::size_t k = 1; k < times.size(); ++k) {
        const auto transition = sde.get_transition_distribution(times[k - 1], times[k]);
        const auto next = transition.condition_on_x(matrix::VectorBatch(x));
        x = sample_gaussian(next.mu().item(), next.Sigma().as_matrix(), rng);
        path.row(static_cast<Eigen::Index>(k)) = x.transpose();
    }
    return path;
}

} // namespace linsde::sde
