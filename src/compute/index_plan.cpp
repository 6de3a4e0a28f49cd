#include "lattice/compute/index_plan.hpp"

namespace lattice::compute {

namespace {

bool is_unit_range(const Index& index) noexcept {
    if (is_slice(index)) {
        return true;
    }
    const auto* r = std::get_if<Range>(&index);
    return r != nullptr && r->is_unit();
}

} // namespace

IndexStyle view_indexing(const std::vector<Index>& indices) noexcept {
    std::size_t p = 0;
    while (p < indices.size()) {
        const Index& head = indices[p];

        // Leading scalars only move the offset
        if (is_scalar(head)) {
            ++p;
            continue;
        }

        if (is_slice(head) && p + 1 < indices.size()) {
            const Index& next = indices[p + 1];
            // A run of slices addresses one contiguous block
            if (is_slice(next)) {
                ++p;
                continue;
            }
            // A unit range may follow slices if only scalars come after it
            if (is_unit_range(next) && all_scalar(indices, p + 2)) {
                return IndexStyle::Linear;
            }
        }

        // A single range is fast when every other index is a scalar
        if (is_slice(head) || is_range(head)) {
            return all_scalar(indices, p + 1) ? IndexStyle::Linear : IndexStyle::Cartesian;
        }

        // Index arrays have no uniform stride
        return IndexStyle::Cartesian;
    }
    return IndexStyle::Linear;
}

IndexPlan classify(const std::vector<Index>& indices, IndexStyle parent_style) noexcept {
    IndexPlan plan;
    plan.style = core::combine(view_indexing(indices), parent_style);
    plan.fast  = plan.style == IndexStyle::Linear;

    // The multiply can be dropped when the first index walks the parent's
    // fastest axis with unit step, or when the view is a single element.
    plan.contiguous =
        plan.fast && (indices.empty() || is_unit_range(indices.front()) || all_scalar(indices));
    return plan;
}

const char* to_string(const IndexPlan& plan) noexcept {
    if (plan.contiguous) {
        return "linear-contiguous";
    }
    if (plan.fast) {
        return "linear-strided";
    }
    return "cartesian";
}

} // namespace lattice::compute
