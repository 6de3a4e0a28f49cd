#include "lattice/compute/reshaped_array.hpp"
#include "lattice/common/errors.hpp"
#include "lattice/compute/index.hpp"
#include <stdexcept>

namespace lattice::compute {

core::Shape reshape_to(const core::Shape& shape, std::size_t n) {
    if (n >= shape.size()) {
        core::Shape out = shape;
        out.resize(n, 1);
        return out;
    }
    if (n == 0) {
        if (core::product(shape) != 1) {
            throw core::DimensionMismatch(shape.size(), 0);
        }
        return {};
    }
    core::Shape out(shape.begin(), shape.begin() + static_cast<std::ptrdiff_t>(n));
    for (std::size_t d = n; d < shape.size(); ++d) {
        out.back() *= shape[d];
    }
    return out;
}

template <Numeric T>
ReshapedArray<T>::ReshapedArray(parent_pointer parent, core::Shape dims)
    : parent_(std::move(parent)), dims_(std::move(dims)) {
    if (core::product(dims_) != parent_->size()) {
        throw std::runtime_error("New dimensions " + to_string(dims_) +
                                 " are not compatible with the current size " +
                                 to_string(parent_->shape()));
    }
}

template <Numeric T>
core::Strides ReshapedArray<T>::strides() const {
    // Only a densely packed column-major parent keeps a uniform stride
    const core::Strides parent_strides = parent_->strides();
    const core::Shape&  parent_shape   = parent_->shape();
    index_type          expected       = 1;
    for (std::size_t d = 0; d < parent_shape.size(); ++d) {
        if (parent_shape[d] != 1 && parent_strides[d] != expected) {
            throw core::NonStridedViewError("ReshapedArray of a non-contiguous parent");
        }
        expected *= static_cast<index_type>(parent_shape[d]);
    }

    core::Strides out(dims_.size());
    index_type    s = 1;
    for (std::size_t d = 0; d < dims_.size(); ++d) {
        out[d] = s;
        s *= static_cast<index_type>(dims_[d]);
    }
    return out;
}

template <Numeric T>
T ReshapedArray<T>::read(index_type linear) const {
    return parent_->read(linear);
}

template <Numeric T>
T ReshapedArray<T>::read(const core::MultiIndex& indices) const {
    return parent_->read(core::cartesian_to_linear(dims_, indices));
}

template <Numeric T>
void ReshapedArray<T>::write(index_type linear, T value) {
    parent_->write(linear, value);
}

template <Numeric T>
void ReshapedArray<T>::write(const core::MultiIndex& indices, T value) {
    parent_->write(core::cartesian_to_linear(dims_, indices), value);
}

template <Numeric T>
void ReshapedArray<T>::collect_storage_ids(std::vector<StorageId>& out, const Region& region) const {
    if (is_empty(region)) {
        return;
    }
    core::MultiIndex lo(dims_.size());
    core::MultiIndex hi(dims_.size());
    for (std::size_t d = 0; d < dims_.size(); ++d) {
        lo[d] = region[d].lo;
        hi[d] = region[d].hi;
    }

    // Bounding box in the parent of every position between the two corners
    const core::Shape& parent_shape = parent_->shape();
    core::MultiIndex   first;
    core::MultiIndex   last;
    core::linear_to_cartesian(parent_shape, core::cartesian_to_linear(dims_, lo), first);
    core::linear_to_cartesian(parent_shape, core::cartesian_to_linear(dims_, hi), last);

    Region parent_region(parent_shape.size());
    bool   varying = false;
    for (std::size_t d = parent_shape.size(); d > 0; --d) {
        const std::size_t k = d - 1;
        if (varying) {
            parent_region[k] = {0, static_cast<index_type>(parent_shape[k]) - 1};
        } else {
            parent_region[k] = {first[k], last[k]};
            varying          = first[k] != last[k];
        }
    }
    parent_->collect_storage_ids(out, parent_region);
}

// Explicit instantiations for common types
template class ReshapedArray<float>;
template class ReshapedArray<double>;
template class ReshapedArray<int>;
template class ReshapedArray<unsigned int>;
template class ReshapedArray<long>;
template class ReshapedArray<unsigned long>;

} // namespace lattice::compute
