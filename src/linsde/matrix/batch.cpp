#include "linsde/matrix/batch.hpp"
#include <fmt/format.h>

namespace linsde::matrix {

BatchSize broadcast_batch_size(BatchSize a, BatchSize b, const char* where) {
    if (!a) return b;
    if (!b) return a;
    if (*a != *b) {
        throw BatchMismatchError(fmt::format(
            "{}: batch sizes {} and {} are not broadcastable", where, *a, *b));
    }
    return a;
}

VectorBatch operator+(const VectorBatch& a, const VectorBatch& b) {
    return zip(a, b, [](const Eigen::VectorXd& x, const Eigen::VectorXd& y) -> Eigen::VectorXd {
        if (x.size() != y.size()) {
            throw ShapeMismatchError(fmt::format("vector add: sizes {} and {}", x.size(), y.size()));
        }
        return x + y;
    }, "vector add");
}

VectorBatch operator-(const VectorBatch& a, const VectorBatch& b) {
    return zip(a, b, [](const Eigen::VectorXd& x, const Eigen::VectorXd& y) -> Eigen::VectorXd {
        if (x.size() != y.size()) {
            throw ShapeMismatchError(fmt::format("vector subtract: sizes {} and {}", x.size(), y.size()));
        }
        return x - y;
    }, "vector subtract");
}

VectorBatch operator*(double k, const VectorBatch& a) {
    return a.map([k](const Eigen::VectorXd& x) -> Eigen::VectorXd { return k * x; });
}

} // namespace linsde::matrix
