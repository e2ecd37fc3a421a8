#pragma once

#include <string>

namespace linsde::matrix {

/// Structural properties asserted on a matrix. PSD implies symmetric.
/// Tags are trusted, never verified numerically.
class Tags {
public:
    constexpr Tags() = default;

    [[nodiscard]] static constexpr Tags no_tags() { return Tags(false, false); }
    [[nodiscard]] static constexpr Tags symmetric() { return Tags(true, false); }
    [[nodiscard]] static constexpr Tags psd() { return Tags(true, true); }

    [[nodiscard]] constexpr bool is_symmetric() const { return symmetric_; }
    [[nodiscard]] constexpr bool is_psd() const { return psd_; }

    // ---- Propagation rules ----

    [[nodiscard]] constexpr Tags after_add(Tags other) const {
        return Tags(symmetric_ && other.symmetric_, psd_ && other.psd_);
    }

    [[nodiscard]] constexpr Tags after_scale(double k) const {
        return Tags(symmetric_, psd_ && k >= 0.0);
    }

    [[nodiscard]] constexpr Tags after_inverse() const { return *this; }
    [[nodiscard]] constexpr Tags after_transpose() const { return *this; }

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] static Tags from_string(const std::string& name);

    friend constexpr bool operator==(Tags a, Tags b) {
        return a.symmetric_ == b.symmetric_ && a.psd_ == b.psd_;
    }

private:
    constexpr Tags(bool symmetric, bool psd) : symmetric_(symmetric || psd), psd_(psd) {}

    bool symmetric_ = false;
    bool psd_ = false;
};

} // namespace linsde::matrix
