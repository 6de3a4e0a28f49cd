#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

namespace lattice {
namespace core {

using Shape      = std::vector<std::size_t>;
using Strides    = std::vector<std::ptrdiff_t>;
using MultiIndex = std::vector<std::ptrdiff_t>;

template <typename T>
concept Numeric = std::is_arithmetic_v<T>;

enum class MemoryLayout {
    RowMajor,   // C-style, last dimension varies fastest
    ColumnMajor // Fortran-style, first dimension varies fastest
};

enum class MemoryOrder {
    Native,    // Use architecture's native alignment
    Aligned64, // Force 64-byte alignment for AVX-512
    Aligned32, // Force 32-byte alignment for AVX-256
    Packed     // No padding, tightly packed
};

// How a container prefers to be addressed. Linear means a single column-major
// position maps to storage in O(1).
enum class IndexStyle {
    Linear,
    Cartesian
};

[[nodiscard]] constexpr IndexStyle combine(IndexStyle a, IndexStyle b) noexcept {
    return (a == IndexStyle::Linear && b == IndexStyle::Linear) ? IndexStyle::Linear
                                                                : IndexStyle::Cartesian;
}

[[nodiscard]] inline std::size_t product(const Shape& shape) noexcept {
    std::size_t n = 1;
    for (std::size_t d : shape) {
        n *= d;
    }
    return n;
}

// Column-major position of `idx` within `shape`
[[nodiscard]] inline std::ptrdiff_t cartesian_to_linear(const Shape&          shape,
                                                        const std::ptrdiff_t* idx,
                                                        std::size_t           n) noexcept {
    std::ptrdiff_t linear = 0;
    std::ptrdiff_t stride = 1;
    for (std::size_t d = 0; d < n; ++d) {
        linear += idx[d] * stride;
        stride *= static_cast<std::ptrdiff_t>(d < shape.size() ? shape[d] : 1);
    }
    return linear;
}

[[nodiscard]] inline std::ptrdiff_t cartesian_to_linear(const Shape&      shape,
                                                        const MultiIndex& idx) noexcept {
    return cartesian_to_linear(shape, idx.data(), idx.size());
}

inline void linear_to_cartesian(const Shape& shape, std::ptrdiff_t linear, MultiIndex& out) {
    out.resize(shape.size());
    for (std::size_t d = 0; d < shape.size(); ++d) {
        const auto extent = static_cast<std::ptrdiff_t>(shape[d]);
        if (d + 1 == shape.size() || extent == 0) {
            out[d] = linear;
            linear = 0;
        } else {
            out[d] = linear % extent;
            linear /= extent;
        }
    }
}

} // namespace core
} // namespace lattice
