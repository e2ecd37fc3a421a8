#pragma once

#include <stdexcept>
#include <string>

namespace linsde {

/// Raised when a model is asked for an attribute it does not carry (e.g. order).
class MissingAttributeError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/// Raised when operands carry incompatible leading batch axes.
class BatchMismatchError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Raised when operand dimensions do not agree.
class ShapeMismatchError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace linsde
