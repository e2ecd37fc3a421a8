#include "linsde/potential/potential_series.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>

namespace linsde::potential {

GaussianPotentialSeries::GaussianPotentialSeries(std::vector<double> times,
                                                 std::vector<MixedGaussian> potentials)
    : times_(std::move(times)), potentials_(std::move(potentials)) {
    if (times_.empty()) {
        throw std::invalid_argument("GaussianPotentialSeries: series is empty");
    }
    if (times_.size() != potentials_.size()) {
        throw ShapeMismatchError(fmt::format(
            "GaussianPotentialSeries: {} times but {} potentials", times_.size(), potentials_.size()));
    }
    for (std::size_t i = 1; i < times_.size(); ++i) {
        if (!(times_[i] > times_[i - 1])) {
            throw std::invalid_argument(fmt::format(
                "GaussianPotentialSeries: times must be strictly increasing ({} then {})",
                times_[i - 1], times_[i]));
        }
    }
    const Eigen::Index n = potentials_.front().dim();
    for (const auto& p : potentials_) {
        if (p.dim() != n) {
            throw ShapeMismatchError(fmt::format(
                "GaussianPotentialSeries: potentials of dimension {} and {}", n, p.dim()));
        }
        batch_size_ = matrix::broadcast_batch_size(batch_size_, p.batch_size(), "GaussianPotentialSeries");
    }
}

GaussianPotentialSeries GaussianPotentialSeries::single(double time, MixedGaussian potential) {
    return GaussianPotentialSeries({time}, {std::move(potential)});
}

GaussianPotentialSeries GaussianPotentialSeries::insert(double time, MixedGaussian potential) const {
    const auto pos = std::lower_bound(times_.begin(), times_.end(), time);
    const auto offset = pos - times_.begin();

    std::vector<double> times = times_;
    std::vector<MixedGaussian> potentials = potentials_;
    times.insert(times.begin() + offset, time);
    potentials.insert(potentials.begin() + offset, std::move(potential));
    return GaussianPotentialSeries(std::move(times), std::move(potentials));
}

std::vector<std::size_t> GaussianPotentialSeries::indices_in(double s, double t) const {
    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < times_.size(); ++i) {
        if (times_[i] > s && times_[i] < t) {
            out.push_back(i);
        }
    }
    return out;
}

std::vector<std::size_t> GaussianPotentialSeries::indices_from(double t) const {
    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < times_.size(); ++i) {
        if (times_[i] >= t) {
            out.push_back(i);
        }
    }
    return out;
}

} // namespace linsde::potential
