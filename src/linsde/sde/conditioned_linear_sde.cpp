#include "linsde/sde/conditioned_linear_sde.hpp"
#include <fmt/format.h>

namespace linsde::sde {

using matrix::Matrix;
using potential::GaussianTransition;
using potential::NaturalGaussian;

ConditionedLinearSDE::ConditionedLinearSDE(
    std::shared_ptr<const AbstractLinearSDE> sde,
    std::shared_ptr<const potential::GaussianPotentialSeries> evidence)
    : sde_(std::move(sde)), evidence_(std::move(evidence)) {
    if (!sde_ || !evidence_) {
        throw std::invalid_argument("ConditionedLinearSDE: SDE and evidence must not be null");
    }
    if (evidence_->dim() != sde_->dim()) {
        throw ShapeMismatchError(fmt::format(
            "ConditionedLinearSDE: evidence of dimension {} for {} of dimension {}",
            evidence_->dim(), sde_->name(), sde_->dim()));
    }
    batch_size_ = matrix::broadcast_batch_size(
        sde_->batch_size(), evidence_->batch_size(), "ConditionedLinearSDE");
}

std::string ConditionedLinearSDE::name() const {
    return fmt::format("ConditionedLinearSDE({}, {} potentials)", sde_->name(), evidence_->size());
}

NaturalGaussian ConditionedLinearSDE::backward_message(double t) const {
    NaturalGaussian message = NaturalGaussian::zeros(dim());
    const auto indices = evidence_->indices_from(t);
    if (indices.empty()) {
        return message;
    }

    // Sweep from the last potential back to the first one at or after t.
    double message_time = evidence_->time(indices.back());
    for (auto it = indices.rbegin(); it != indices.rend(); ++it) {
        const double tk = evidence_->time(*it);
        if (tk < message_time) {
            message = sde_->get_transition_distribution(tk, message_time).backward_message(message);
        }
        message = message + (*evidence_)[*it].to_natural();
        message_time = tk;
    }
    if (message_time > t) {
        message = sde_->get_transition_distribution(t, message_time).backward_message(message);
    }
    return message;
}

LinearSDEParams ConditionedLinearSDE::get_params(double t) const {
    const LinearSDEParams base = sde_->get_params(t);
    const NaturalGaussian message = backward_message(t);
    const Matrix LLT = base.L * base.L.transpose();
    return LinearSDEParams{
        base.F - LLT * message.J(),
        base.u + LLT * message.h(),
        base.L
    };
}

GaussianTransition ConditionedLinearSDE::get_transition_distribution(double s, double t) const {
    check_time_order(s, t, "ConditionedLinearSDE::get_transition_distribution");

    // Split (s, t) at the evidence strictly inside it. On each piece the
    // conditioned kernel is the base kernel updated with the message at its end.
    const auto inside = evidence_->indices_in(s, t);
    std::vector<double> knots;
    knots.reserve(inside.size() + 2);
    knots.push_back(s);
    for (auto i : inside) {
        knots.push_back(evidence_->time(i));
    }
    knots.push_back(t);

    NaturalGaussian message = backward_message(t);
    std::optional<GaussianTransition> result;
    for (std::size_t k = knots.size() - 1; k >= 1; --k) {
        const GaussianTransition base = sde_->get_transition_distribution(knots[k - 1], knots[k]);
        const GaussianTransition piece = base.update_y(message);
        result = result ? piece.chain(*result) : piece;

        if (k > 1) {
            message = base.backward_message(message) + (*evidence_)[inside[k - 2]].to_natural();
        }
    }
    return *result;
}

} // namespace linsde::sde
