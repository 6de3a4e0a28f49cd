#pragma once

#include "lattice/compute/index.hpp"
#include <vector>

namespace lattice::compute {

// Index lists against the axes of `shape`. When fewer indices than axes are
// given, the last index spans the remaining axes; surplus trailing indices
// may only select position 0.
[[nodiscard]] bool in_bounds(const Shape& shape, const std::vector<Index>& indices);
void               checkbounds(const Shape& shape, const std::vector<Index>& indices);

// Element positions
[[nodiscard]] bool in_bounds(const Shape& shape, const MultiIndex& indices) noexcept;
[[nodiscard]] bool in_bounds(const Shape& shape, index_type linear) noexcept;
void               checkbounds(const Shape& shape, const MultiIndex& indices);
void               checkbounds(const Shape& shape, index_type linear);

} // namespace lattice::compute
