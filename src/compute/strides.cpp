#include "lattice/compute/strides.hpp"
#include "lattice/common/errors.hpp"

namespace lattice::compute {

namespace {

index_type axis_length(const Shape& shape, std::size_t d) noexcept {
    return d < shape.size() ? static_cast<index_type>(shape[d]) : 1;
}

} // namespace

index_type compute_stride1(const Shape& parent_shape, const std::vector<Index>& indices) {
    index_type  s   = 1;
    std::size_t dim = 0;
    for (std::size_t p = 0; p < indices.size(); ++p) {
        const Index& index = indices[p];
        if (is_scalar(index)) {
            if (all_scalar(indices, p)) {
                return s;
            }
            s *= axis_length(parent_shape, dim);
            ++dim;
            continue;
        }
        if (is_slice(index)) {
            return s;
        }
        if (const auto* r = std::get_if<Range>(&index)) {
            return s * r->step;
        }
        throw core::NonStridedViewError("invalid strided index type " + to_string(index));
    }
    return s;
}

index_type compute_linindex(const Shape& parent_shape, const std::vector<Index>& indices) {
    index_type  f   = 0;
    index_type  s   = 1;
    std::size_t dim = 0;
    for (const auto& index : indices) {
        const auto* array = std::get_if<IndexArray>(&index);
        if (array != nullptr && array->width() != 1) {
            // Multi-index elements spread over several parent axes
            for (std::size_t c = 0; c < array->width(); ++c) {
                const index_type first = array->empty() ? 0 : array->component(0, c);
                f += first * s;
                s *= axis_length(parent_shape, dim++);
            }
            continue;
        }
        f += first_value(index) * s;
        s *= axis_length(parent_shape, dim++);
    }
    return f;
}

index_type compute_offset1(const Shape&              parent_shape,
                           index_type                stride1,
                           const std::vector<Index>& indices) {
    // View axes start at 0, so element 0 sits at the first selected position
    // and the stride correction stride1 * first_axis_index vanishes.
    constexpr index_type first_axis_index = 0;
    return compute_linindex(parent_shape, indices) - stride1 * first_axis_index;
}

Strides substrides(const Strides& parent_strides, const std::vector<Index>& indices) {
    Strides     out;
    std::size_t dim = 0;
    for (const auto& index : indices) {
        const index_type parent_stride = dim < parent_strides.size() ? parent_strides[dim] : 1;
        if (is_scalar(index)) {
            // dropped dimension
        } else if (is_slice(index)) {
            out.push_back(parent_stride);
        } else if (const auto* r = std::get_if<Range>(&index)) {
            out.push_back(parent_stride * r->step);
        } else {
            throw core::NonStridedViewError(to_string(index));
        }
        dim += consumed_dims(index);
    }
    return out;
}

} // namespace lattice::compute
