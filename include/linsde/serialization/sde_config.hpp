#pragma once

#include "linsde/sde/sde_base.hpp"
#include <memory>
#include <nlohmann/json.hpp>

namespace linsde::serialization {

/// Build an SDE from a model description, e.g.
///   {"type": "ornstein_uhlenbeck", "sigma": 1.0, "lambda": 0.5, "dim": 2}
///   {"type": "time_scaled", "time_scale": 2.0, "sde": {...}}
/// Supported types: brownian_motion, ornstein_uhlenbeck, wiener_velocity,
/// critically_damped_langevin, variance_preserving, variance_exploding,
/// linear_time_invariant (with structured "F" and "L") and time_scaled.
/// Unknown types and missing fields throw std::invalid_argument.
[[nodiscard]] std::shared_ptr<const sde::AbstractLinearSDE> sde_from_json(const nlohmann::json& config);

} // namespace linsde::serialization
