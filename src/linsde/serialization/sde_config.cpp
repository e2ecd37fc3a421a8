#include "linsde/serialization/sde_config.hpp"
#include "linsde/serialization/json.hpp"
#include "linsde/sde/brownian_motion.hpp"
#include "linsde/sde/critically_damped_langevin.hpp"
#include "linsde/sde/ornstein_uhlenbeck.hpp"
#include "linsde/sde/variance_exploding.hpp"
#include "linsde/sde/variance_preserving.hpp"
#include "linsde/sde/wiener_velocity_model.hpp"
#include <fmt/format.h>

namespace linsde::serialization {

namespace {

template <typename T>
T required(const json& config, const char* key) {
    if (!config.contains(key)) {
        throw std::invalid_argument(fmt::format(
            "sde_from_json: '{}' model is missing field '{}'", config.value("type", std::string("?")), key));
    }
    try {
        return config.at(key).get<T>();
    } catch (const json::exception& e) {
        throw std::invalid_argument(fmt::format("sde_from_json: field '{}': {}", key, e.what()));
    }
}

template <typename T>
T optional_field(const json& config, const char* key, T fallback) {
    return config.contains(key) ? required<T>(config, key) : fallback;
}

} // namespace

std::shared_ptr<const sde::AbstractLinearSDE> sde_from_json(const json& config) {
    if (!config.is_object() || !config.contains("type")) {
        throw std::invalid_argument("sde_from_json: model description must be an object with a 'type'");
    }
    const auto type = config.at("type").get<std::string>();

    if (type == "brownian_motion") {
        return std::make_shared<sde::BrownianMotion>(
            required<double>(config, "sigma"),
            required<Eigen::Index>(config, "dim"));
    }
    if (type == "ornstein_uhlenbeck") {
        return std::make_shared<sde::OrnsteinUhlenbeck>(
            required<double>(config, "sigma"),
            required<double>(config, "lambda"),
            required<Eigen::Index>(config, "dim"));
    }
    if (type == "wiener_velocity") {
        return std::make_shared<sde::WienerVelocityModel>(
            required<double>(config, "sigma"),
            required<Eigen::Index>(config, "position_dim"),
            optional_field<int>(config, "order", 2));
    }
    if (type == "critically_damped_langevin") {
        return std::make_shared<sde::CriticallyDampedLangevinDynamics>(
            required<double>(config, "mass"),
            required<double>(config, "beta"),
            required<Eigen::Index>(config, "dim"));
    }
    if (type == "variance_preserving") {
        return std::make_shared<sde::VariancePreserving>(
            required<double>(config, "beta_min"),
            required<double>(config, "beta_max"),
            required<Eigen::Index>(config, "dim"));
    }
    if (type == "variance_exploding") {
        return std::make_shared<sde::VarianceExploding>(
            required<double>(config, "sigma_min"),
            required<double>(config, "sigma_max"),
            required<Eigen::Index>(config, "dim"));
    }
    if (type == "linear_time_invariant") {
        return std::make_shared<sde::LinearTimeInvariantSDE>(
            structured_matrix_from_json(required<json>(config, "F")),
            structured_matrix_from_json(required<json>(config, "L")));
    }
    if (type == "time_scaled") {
        auto base = std::dynamic_pointer_cast<const sde::AbstractLinearTimeInvariantSDE>(
            sde_from_json(required<json>(config, "sde")));
        if (!base) {
            throw std::invalid_argument("sde_from_json: time_scaled requires a time-invariant base model");
        }
        return std::make_shared<sde::TimeScaledLinearTimeInvariantSDE>(
            std::move(base), required<double>(config, "time_scale"));
    }
    throw std::invalid_argument(fmt::format("sde_from_json: unknown model type '{}'", type));
}

} // namespace linsde::serialization
