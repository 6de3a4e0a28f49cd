#include "lattice/compute/aliasing.hpp"
#include "lattice/common/logging.hpp"
#include <numeric>
#include <string>

namespace lattice::compute {

namespace {

// Dense replacement for one index together with the extents it needs
Index densify(const Index& index, Shape& trimmed) {
    if (std::holds_alternative<Scalar>(index)) {
        trimmed.push_back(1);
        return Scalar{0};
    }
    if (const auto* slice = std::get_if<FullSlice>(&index)) {
        trimmed.push_back(slice->extent);
        return FullSlice{slice->extent};
    }
    if (const auto* r = std::get_if<Range>(&index)) {
        trimmed.push_back(r->length);
        return Range{0, 1, r->length};
    }

    const auto& array = std::get<IndexArray>(index);
    if (array.width() == 0) {
        return array;
    }
    trimmed.push_back(array.length());
    if (array.width() == 1) {
        std::vector<index_type> values(array.length());
        std::iota(values.begin(), values.end(), index_type{0});
        return IndexArray(std::move(values), array.shape());
    }
    // Element k lands at (k, 0, ..., 0)
    for (std::size_t c = 1; c < array.width(); ++c) {
        trimmed.push_back(1);
    }
    std::vector<index_type> components(array.length() * array.width(), 0);
    for (std::size_t k = 0; k < array.length(); ++k) {
        components[k * array.width()] = static_cast<index_type>(k);
    }
    return IndexArray::of_multi(std::move(components), array.width(), array.shape());
}

} // namespace

template <Numeric T>
std::vector<StorageId> storage_identities(const Container<T>& container) {
    std::vector<StorageId> ids;
    container.collect_storage_ids(ids, full_region(container.shape()));
    return ids;
}

bool ids_intersect(const std::vector<StorageId>& a, const std::vector<StorageId>& b) noexcept {
    for (const auto& x : a) {
        for (const auto& y : b) {
            if (x.overlaps(y)) {
                return true;
            }
        }
    }
    return false;
}

template <Numeric T>
bool may_alias(const Container<T>& a, const Container<T>& b) {
    if (&a == &b) {
        return true;
    }
    return ids_intersect(storage_identities(a), storage_identities(b));
}

template <Numeric T>
std::shared_ptr<View<T>> defensive_copy(const View<T>& source) {
    TIME_OPERATION("defensive_copy", "shape=" + to_string(source.shape()));

    Shape              trimmed;
    std::vector<Index> indices;
    indices.reserve(source.parent_indices().size());
    for (const auto& index : source.parent_indices()) {
        indices.push_back(densify(index, trimmed));
    }

    auto dest = std::make_shared<DenseArray<T>>(trimmed, MemoryLayout::ColumnMajor);
    auto copy = View<T>::construct(dest, std::move(indices));

    const auto n = static_cast<index_type>(source.size());
    for (index_type i = 0; i < n; ++i) {
        copy->unsafe_set(i, source.unsafe_get(i));
    }

    LOG_DEBUG("Defensive copy of ", n, " elements into buffer of shape ", to_string(trimmed));
    return copy;
}

template <Numeric T>
std::shared_ptr<View<T>> unalias(const Container<T>& dest, std::shared_ptr<View<T>> source) {
    if (may_alias<T>(dest, *source)) {
        return defensive_copy(*source);
    }
    return source;
}

// Explicit instantiations for common types
#define LATTICE_INSTANTIATE_ALIASING(T)                                                            \
    template std::vector<StorageId> storage_identities<T>(const Container<T>&);                    \
    template bool                   may_alias<T>(const Container<T>&, const Container<T>&);        \
    template std::shared_ptr<View<T>> defensive_copy<T>(const View<T>&);                           \
    template std::shared_ptr<View<T>> unalias<T>(const Container<T>&, std::shared_ptr<View<T>>);

LATTICE_INSTANTIATE_ALIASING(float)
LATTICE_INSTANTIATE_ALIASING(double)
LATTICE_INSTANTIATE_ALIASING(int)
LATTICE_INSTANTIATE_ALIASING(unsigned int)
LATTICE_INSTANTIATE_ALIASING(long)
LATTICE_INSTANTIATE_ALIASING(unsigned long)

#undef LATTICE_INSTANTIATE_ALIASING

} // namespace lattice::compute
