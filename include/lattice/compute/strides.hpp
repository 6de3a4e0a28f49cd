#pragma once

#include "lattice/compute/index.hpp"
#include <vector>

namespace lattice::compute {

// Parent linear distance between consecutive view elements. Only meaningful
// for index lists the classifier marked fast.
[[nodiscard]] index_type compute_stride1(const Shape& parent_shape, const std::vector<Index>& indices);

// Parent linear index of the first selected element
[[nodiscard]] index_type compute_linindex(const Shape& parent_shape, const std::vector<Index>& indices);

// Parent linear index of view element 0
[[nodiscard]] index_type compute_offset1(const Shape&              parent_shape,
                                         index_type                stride1,
                                         const std::vector<Index>& indices);

// Memory strides of each view dimension
[[nodiscard]] Strides substrides(const Strides& parent_strides, const std::vector<Index>& indices);

} // namespace lattice::compute
