#include "linsde/matrix/tags.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace linsde::matrix {

std::string Tags::to_string() const {
    if (psd_) return "psd";
    if (symmetric_) return "symmetric";
    return "no_tags";
}

Tags Tags::from_string(const std::string& name) {
    if (name == "psd") return psd();
    if (name == "symmetric") return symmetric();
    if (name == "no_tags") return no_tags();
    throw std::invalid_argument(fmt::format("Tags::from_string: unknown tag '{}'", name));
}

} // namespace linsde::matrix
