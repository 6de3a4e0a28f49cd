#pragma once

#include "lattice/compute/index.hpp"
#include <vector>

namespace lattice::compute {

// Addressing strategy of a view, fixed at construction
struct IndexPlan {
    IndexStyle style      = IndexStyle::Cartesian;
    bool       fast       = false; // offset1 + stride1 * i addressing
    bool       contiguous = false; // offset1 + i addressing
};

// Linear compatibility of an index list on its own, ignoring the parent
[[nodiscard]] IndexStyle view_indexing(const std::vector<Index>& indices) noexcept;

[[nodiscard]] IndexPlan classify(const std::vector<Index>& indices, IndexStyle parent_style) noexcept;

[[nodiscard]] const char* to_string(const IndexPlan& plan) noexcept;

} // namespace lattice::compute
