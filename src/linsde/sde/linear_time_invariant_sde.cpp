#include "linsde/sde/linear_time_invariant_sde.hpp"
#include <fmt/format.h>

namespace linsde::sde {

LinearTimeInvariantSDE::LinearTimeInvariantSDE(matrix::Matrix F, matrix::Matrix L)
    : F_(std::move(F)), L_(std::move(L)) {
    if (F_.rows() != F_.cols()) {
        throw ShapeMismatchError(fmt::format(
            "LinearTimeInvariantSDE: F must be square, got {}x{}", F_.rows(), F_.cols()));
    }
    if (L_.rows() != F_.rows()) {
        throw ShapeMismatchError(fmt::format(
            "LinearTimeInvariantSDE: L has {} rows but the state has dimension {}", L_.rows(), F_.rows()));
    }
    // Fails fast on incompatible batch axes.
    matrix::broadcast_batch_size(F_.batch_size(), L_.batch_size(), "LinearTimeInvariantSDE");
}

} // namespace linsde::sde
