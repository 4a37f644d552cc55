// errors.hpp — exception types raised by the shuffle and simulation core
#pragma once

#include <stdexcept>
#include <string>

namespace core {

// Caller passed a value outside an operation's domain (negative inequality,
// zero simulation count, degenerate weight vector).
class InvalidParameter : public std::invalid_argument {
public:
    explicit InvalidParameter(const std::string& what) : std::invalid_argument(what) {}
};

// A shuffle procedure returned something that is not a permutation of its input.
class ShapeMismatch : public std::runtime_error {
public:
    explicit ShapeMismatch(const std::string& what) : std::runtime_error(what) {}
};

} // namespace core
