#pragma once

#include "linsde/errors.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <fmt/format.h>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace linsde::matrix {

/// Size of the leading batch axis; empty for unbatched values.
using BatchSize = std::optional<std::size_t>;

/// Combine two batch sizes. Unbatched operands broadcast; two batched operands
/// must agree or BatchMismatchError is thrown.
BatchSize broadcast_batch_size(BatchSize a, BatchSize b, const char* where);

/// A value that is either unbatched (one item) or carries a leading batch axis.
/// Indexing an unbatched value with any batch index returns the single item.
template <typename T>
class Batch {
public:
    Batch() = default;

    Batch(T item) : items_{std::move(item)} {}

    /// Stack items along a new leading batch axis.
    [[nodiscard]] static Batch stacked(std::vector<T> items) {
        if (items.empty()) {
            throw std::invalid_argument("Batch::stacked: batch must have at least one item");
        }
        return make(std::move(items), true);
    }

    /// Unbatched values hold exactly one item; anything else throws BatchMismatchError.
    [[nodiscard]] static Batch make(std::vector<T> items, bool batched) {
        if (!batched && items.size() != 1) {
            throw BatchMismatchError(fmt::format(
                "Batch::make: an unbatched value must hold exactly one item, got {}", items.size()));
        }
        Batch b;
        b.items_ = std::move(items);
        b.batched_ = batched;
        return b;
    }

    [[nodiscard]] BatchSize batch_size() const {
        return batched_ ? BatchSize(items_.size()) : std::nullopt;
    }
    [[nodiscard]] bool is_batched() const { return batched_; }
    [[nodiscard]] std::size_t count() const { return items_.size(); }

    [[nodiscard]] const T& operator[](std::size_t b) const {
        return batched_ ? items_.at(b) : items_.front();
    }

    /// The single item of an unbatched value.
    [[nodiscard]] const T& item() const {
        if (batched_) {
            throw BatchMismatchError("Batch::item: value is batched, index it explicitly");
        }
        return items_.front();
    }

    [[nodiscard]] const std::vector<T>& items() const { return items_; }

    template <typename Fn>
    [[nodiscard]] auto map(Fn&& fn) const {
        using R = std::decay_t<std::invoke_result_t<Fn&, const T&>>;
        std::vector<R> out;
        out.reserve(items_.size());
        for (const auto& x : items_) {
            out.push_back(fn(x));
        }
        return Batch<R>::make(std::move(out), batched_);
    }

private:
    std::vector<T> items_;
    bool batched_ = false;
};

/// Apply fn item-by-item over two values, broadcasting an unbatched operand.
template <typename A, typename B, typename Fn>
[[nodiscard]] auto zip(const Batch<A>& a, const Batch<B>& b, Fn&& fn, const char* where = "zip") {
    using R = std::decay_t<std::invoke_result_t<Fn&, const A&, const B&>>;
    const BatchSize bs = broadcast_batch_size(a.batch_size(), b.batch_size(), where);
    const std::size_t n = bs ? *bs : 1;
    std::vector<R> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(fn(a[i], b[i]));
    }
    return Batch<R>::make(std::move(out), bs.has_value());
}

using VectorBatch = Batch<Eigen::VectorXd>;
using DenseBatch = Batch<Eigen::MatrixXd>;

// ---- Vector arithmetic ----

VectorBatch operator+(const VectorBatch& a, const VectorBatch& b);
VectorBatch operator-(const VectorBatch& a, const VectorBatch& b);
VectorBatch operator*(double k, const VectorBatch& a);

/// Unbatched zero vector of length dim.
[[nodiscard]] inline VectorBatch zero_vector(Eigen::Index dim) {
    return VectorBatch(Eigen::VectorXd::Zero(dim));
}

} // namespace linsde::matrix
