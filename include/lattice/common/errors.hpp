#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace lattice {
namespace core {

// Base class of every error raised by the view layer
class ViewError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Index count does not match the dimensionality of the parent
class DimensionMismatch : public ViewError {
public:
    DimensionMismatch(std::size_t expected, std::size_t actual)
        : ViewError("number of indices (" + std::to_string(actual) +
                    ") must match the parent dimensionality (" + std::to_string(expected) + ")"),
          expected_(expected), actual_(actual) {}

    [[nodiscard]] std::size_t expected() const noexcept {
        return expected_;
    }
    [[nodiscard]] std::size_t actual() const noexcept {
        return actual_;
    }

private:
    std::size_t expected_;
    std::size_t actual_;
};

// Raised only by the checked access paths
class OutOfBounds : public ViewError {
public:
    explicit OutOfBounds(const std::string& what) : ViewError("Index out of bounds: " + what) {}
};

// Stride or offset requested where no uniform stride exists
class NonStridedViewError : public ViewError {
public:
    explicit NonStridedViewError(const std::string& what)
        : ViewError("strides are invalid for views with indices of type " + what) {}
};

// Internal invariant violation while composing a view of a view
class ReindexArityError : public ViewError {
public:
    explicit ReindexArityError(const std::string& what)
        : ViewError("cannot re-index view: " + what +
                    "\nThis should not occur; please submit a bug report.") {}
};

} // namespace core
} // namespace lattice
