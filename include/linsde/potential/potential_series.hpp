#pragma once

#include "linsde/potential/gaussian.hpp"
#include <cstddef>
#include <vector>

namespace linsde::potential {

/// Observed evidence: potentials on the state at strictly increasing times.
/// Immutable; insert() returns a new series.
class GaussianPotentialSeries {
public:
    GaussianPotentialSeries(std::vector<double> times, std::vector<MixedGaussian> potentials);

    /// Length-1 series holding a single potential.
    [[nodiscard]] static GaussianPotentialSeries single(double time, MixedGaussian potential);

    /// Copy of this series with one more potential at `time`.
    [[nodiscard]] GaussianPotentialSeries insert(double time, MixedGaussian potential) const;

    [[nodiscard]] std::size_t size() const { return times_.size(); }
    [[nodiscard]] const std::vector<double>& times() const { return times_; }
    [[nodiscard]] double time(std::size_t i) const { return times_.at(i); }
    [[nodiscard]] const MixedGaussian& operator[](std::size_t i) const { return potentials_.at(i); }
    [[nodiscard]] const std::vector<MixedGaussian>& potentials() const { return potentials_; }

    [[nodiscard]] Eigen::Index dim() const { return potentials_.front().dim(); }
    [[nodiscard]] matrix::BatchSize batch_size() const { return batch_size_; }

    /// Indices of the potentials with s < time < t.
    [[nodiscard]] std::vector<std::size_t> indices_in(double s, double t) const;

    /// Indices of the potentials with time >= t.
    [[nodiscard]] std::vector<std::size_t> indices_from(double t) const;

private:
    std::vector<double> times_;
    std::vector<MixedGaussian> potentials_;
    matrix::BatchSize batch_size_;
};

} // namespace linsde::potential
