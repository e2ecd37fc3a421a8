#pragma once

#include <nlohmann/json.hpp>
#include <Eigen/Dense>
#include <fmt/format.h>

#include "linsde/matrix/matrix.hpp"
#include "linsde/potential/gaussian.hpp"
#include "linsde/potential/potential_series.hpp"
#include "linsde/potential/transition.hpp"

#include <string>
#include <vector>

namespace linsde::serialization {

using json = nlohmann::json;

// ============================================================
// Eigen helpers
// ============================================================

inline json vector_to_json(const Eigen::VectorXd& v) {
    json arr = json::array();
    for (Eigen::Index i = 0; i < v.size(); ++i) {
        arr.push_back(v(i));
    }
    return arr;
}

inline Eigen::VectorXd vector_from_json(const json& j) {
    Eigen::VectorXd v(static_cast<Eigen::Index>(j.size()));
    for (std::size_t i = 0; i < j.size(); ++i) {
        v(static_cast<Eigen::Index>(i)) = j[i].get<double>();
    }
    return v;
}

inline json matrix_to_json(const Eigen::MatrixXd& m) {
    json obj;
    obj["rows"] = m.rows();
    obj["cols"] = m.cols();
    json data = json::array();
    for (Eigen::Index i = 0; i < m.rows(); ++i) {
        for (Eigen::Index j = 0; j < m.cols(); ++j) {
            data.push_back(m(i, j));
        }
    }
    obj["data"] = std::move(data);
    return obj;
}

inline Eigen::MatrixXd matrix_from_json(const json& j) {
    const auto rows = j.at("rows").get<Eigen::Index>();
    const auto cols = j.at("cols").get<Eigen::Index>();
    const auto& data = j.at("data");
    if (data.size() != static_cast<std::size_t>(rows * cols)) {
        throw std::invalid_argument("matrix_from_json: data does not match rows x cols");
    }
    Eigen::MatrixXd m(rows, cols);
    std::size_t idx = 0;
    for (Eigen::Index i = 0; i < rows; ++i) {
        for (Eigen::Index jj = 0; jj < cols; ++jj) {
            m(i, jj) = data[idx++].get<double>();
        }
    }
    return m;
}

// ============================================================
// Batches: unbatched values are stored bare, batched ones as
// {"batch": [item, ...]}
// ============================================================

inline json to_json(const matrix::VectorBatch& v) {
    if (!v.is_batched()) {
        return vector_to_json(v.item());
    }
    json items = json::array();
    for (const auto& x : v.items()) {
        items.push_back(vector_to_json(x));
    }
    return json{{"batch", std::move(items)}};
}

inline matrix::VectorBatch vector_batch_from_json(const json& j) {
    if (j.is_object()) {
        std::vector<Eigen::VectorXd> items;
        for (const auto& item : j.at("batch")) {
            items.push_back(vector_from_json(item));
        }
        return matrix::VectorBatch::stacked(std::move(items));
    }
    return matrix::VectorBatch(vector_from_json(j));
}

// ============================================================
// Structured matrices
// ============================================================

inline json to_json(const matrix::Matrix& m) {
    json j;
    j["type"] = m.is_diagonal() ? "diagonal" : "dense";
    j["tags"] = m.tags().to_string();
    json elements = json::array();
    const std::size_t n = m.batch_size().value_or(1);
    for (std::size_t b = 0; b < n; ++b) {
        if (m.is_diagonal()) {
            elements.push_back(vector_to_json(m.elements(b).col(0)));
        } else {
            elements.push_back(matrix_to_json(m.elements(b)));
        }
    }
    j["batched"] = m.batch_size().has_value();
    j["elements"] = std::move(elements);
    return j;
}

inline matrix::Matrix structured_matrix_from_json(const json& j) {
    const auto type = j.at("type").get<std::string>();
    const auto tags = matrix::Tags::from_string(j.value("tags", std::string("no_tags")));
    const bool batched = j.value("batched", false);
    const auto& elements = j.at("elements");
    if (elements.empty()) {
        throw std::invalid_argument("structured_matrix_from_json: no elements");
    }

    if (type == "diagonal") {
        std::vector<Eigen::VectorXd> items;
        for (const auto& e : elements) {
            items.push_back(vector_from_json(e));
        }
        return matrix::DiagonalMatrix(matrix::VectorBatch::make(std::move(items), batched), tags);
    }
    if (type == "dense") {
        std::vector<Eigen::MatrixXd> items;
        for (const auto& e : elements) {
            items.push_back(matrix_from_json(e));
        }
        return matrix::DenseMatrix(matrix::DenseBatch::make(std::move(items), batched), tags);
    }
    throw std::invalid_argument(fmt::format("structured_matrix_from_json: unknown matrix type '{}'", type));
}

// ============================================================
// Gaussians
// ============================================================

inline json to_json(const potential::StandardGaussian& g) {
    json j;
    j["type"] = "StandardGaussian";
    j["mu"] = to_json(g.mu());
    j["Sigma"] = to_json(g.Sigma());
    return j;
}

inline potential::StandardGaussian standard_gaussian_from_json(const json& j) {
    return potential::StandardGaussian(
        vector_batch_from_json(j.at("mu")),
        structured_matrix_from_json(j.at("Sigma")));
}

inline json to_json(const potential::MixedGaussian& g) {
    json j;
    j["type"] = "MixedGaussian";
    j["mu"] = to_json(g.mu());
    j["J"] = to_json(g.J());
    return j;
}

inline potential::MixedGaussian mixed_gaussian_from_json(const json& j) {
    return potential::MixedGaussian(
        vector_batch_from_json(j.at("mu")),
        structured_matrix_from_json(j.at("J")));
}

// ============================================================
// GaussianTransition
// ============================================================

inline json to_json(const potential::GaussianTransition& t) {
    json j;
    j["type"] = "GaussianTransition";
    j["A"] = to_json(t.A());
    j["u"] = to_json(t.u());
    j["Sigma"] = to_json(t.Sigma());
    return j;
}

inline potential::GaussianTransition transition_from_json(const json& j) {
    return potential::GaussianTransition(
        structured_matrix_from_json(j.at("A")),
        vector_batch_from_json(j.at("u")),
        structured_matrix_from_json(j.at("Sigma")));
}

// ============================================================
// GaussianPotentialSeries
// ============================================================

inline json to_json(const potential::GaussianPotentialSeries& series) {
    json j;
    j["type"] = "GaussianPotentialSeries";
    j["times"] = series.times();
    json potentials = json::array();
    for (const auto& p : series.potentials()) {
        potentials.push_back(to_json(p));
    }
    j["potentials"] = std::move(potentials);
    return j;
}

inline potential::GaussianPotentialSeries potential_series_from_json(const json& j) {
    std::vector<potential::MixedGaussian> potentials;
    for (const auto& p : j.at("potentials")) {
        potentials.push_back(mixed_gaussian_from_json(p));
    }
    return potential::GaussianPotentialSeries(
        j.at("times").get<std::vector<double>>(),
        std::move(potentials));
}

} // namespace linsde::serialization
