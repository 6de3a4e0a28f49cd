#include "lattice/compute/bounds.hpp"
#include "lattice/common/errors.hpp"
#include <string>

namespace lattice::compute {

namespace {

bool within(index_type i, index_type extent) noexcept {
    return i >= 0 && i < extent;
}

// `axes` holds one length per component consumed by `index`
bool index_within(const Index& index, const std::vector<index_type>& axes) {
    if (const auto* s = std::get_if<Scalar>(&index)) {
        return within(s->value, axes[0]);
    }
    if (const auto* slice = std::get_if<FullSlice>(&index)) {
        return !slice->is_resolved() || static_cast<index_type>(slice->extent) <= axes[0];
    }
    if (const auto* r = std::get_if<Range>(&index)) {
        return r->length == 0 || (within(r->start, axes[0]) && within(r->last(), axes[0]));
    }
    const auto& array = std::get<IndexArray>(index);
    if (array.empty()) {
        return true;
    }
    for (std::size_t c = 0; c < array.width(); ++c) {
        const auto [lo, hi] = array.bounds(c);
        if (!within(lo, axes[c]) || !within(hi, axes[c])) {
            return false;
        }
    }
    return true;
}

} // namespace

bool in_bounds(const Shape& shape, const std::vector<Index>& indices) {
    std::size_t dim = 0;
    for (std::size_t i = 0; i < indices.size(); ++i) {
        const std::size_t        width = consumed_dims(indices[i]);
        const bool               last  = (i + 1 == indices.size());
        std::vector<index_type> axes(width, 1);
        for (std::size_t c = 0; c < width; ++c) {
            if (dim + c < shape.size()) {
                axes[c] = static_cast<index_type>(shape[dim + c]);
            }
        }
        if (last && width > 0) {
            for (std::size_t d = dim + width; d < shape.size(); ++d) {
                axes[width - 1] *= static_cast<index_type>(shape[d]);
            }
            dim = shape.size();
        } else {
            dim += width;
        }
        if (!index_within(indices[i], axes)) {
            return false;
        }
    }
    // Axes that received no index are implicitly selected at position 0
    for (std::size_t d = dim; d < shape.size(); ++d) {
        if (shape[d] != 1) {
            return false;
        }
    }
    return true;
}

void checkbounds(const Shape& shape, const std::vector<Index>& indices) {
    if (!in_bounds(shape, indices)) {
        throw core::OutOfBounds("attempt to access array of shape " + to_string(shape) +
                                " at index " + to_string(indices));
    }
}

bool in_bounds(const Shape& shape, const MultiIndex& indices) noexcept {
    if (indices.size() != shape.size()) {
        return false;
    }
    for (std::size_t d = 0; d < shape.size(); ++d) {
        if (!within(indices[d], static_cast<index_type>(shape[d]))) {
            return false;
        }
    }
    return true;
}

bool in_bounds(const Shape& shape, index_type linear) noexcept {
    return within(linear, static_cast<index_type>(core::product(shape)));
}

void checkbounds(const Shape& shape, const MultiIndex& indices) {
    if (indices.size() != shape.size()) {
        throw core::DimensionMismatch(shape.size(), indices.size());
    }
    if (!in_bounds(shape, indices)) {
        std::string text = "[";
        for (std::size_t d = 0; d < indices.size(); ++d) {
            text += (d > 0 ? ", " : "") + std::to_string(indices[d]);
        }
        throw core::OutOfBounds("attempt to access array of shape " + to_string(shape) +
                                " at index " + text + "]");
    }
}

void checkbounds(const Shape& shape, index_type linear) {
    if (!in_bounds(shape, linear)) {
        throw core::OutOfBounds("attempt to access array of shape " + to_string(shape) +
                                " at linear index " + std::to_string(linear));
    }
}

} // namespace lattice::compute
