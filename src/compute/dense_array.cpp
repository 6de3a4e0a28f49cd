#include "lattice/compute/dense_array.hpp"
#include "lattice/common/errors.hpp"
#include "lattice/compute/index.hpp"
#include <algorithm>
#include <cstdlib> // For posix_memalign and free
#include <stdexcept>
#include <string>

namespace lattice::compute {

// --- DenseArray Implementation ---

template <Numeric T>
DenseArray<T>::DenseArray(std::initializer_list<size_type> dims, MemoryLayout layout, MemoryOrder order)
    : DenseArray(core::Shape(dims), layout, order) {}

template <Numeric T>
DenseArray<T>::DenseArray(const core::Shape& dims, MemoryLayout layout, MemoryOrder order)
    : data_(nullptr), dims_(dims), size_(core::product(dims)), layout_(layout), order_(order) {
    if (dims_.size() > MAX_DIMS) {
        throw std::runtime_error("Too many dimensions");
    }
    allocate();
    compute_strides();
    zero();
}

template <Numeric T>
DenseArray<T>::DenseArray(DenseArray&& other) noexcept
    : data_(other.data_), dims_(std::move(other.dims_)), strides_(std::move(other.strides_)),
      size_(other.size_), layout_(other.layout_), order_(other.order_) {
    other.data_ = nullptr;
    other.size_ = 0;
    other.dims_.assign(1, 0);
    other.strides_.assign(1, 1);
}

template <Numeric T>
DenseArray<T>& DenseArray<T>::operator=(DenseArray&& other) noexcept {
    if (this != &other) {
        deallocate();

        data_    = other.data_;
        dims_    = std::move(other.dims_);
        strides_ = std::move(other.strides_);
        size_    = other.size_;
        layout_  = other.layout_;
        order_   = other.order_;

        other.data_ = nullptr;
        other.size_ = 0;
        other.dims_.assign(1, 0);
        other.strides_.assign(1, 1);
    }
    return *this;
}

template <Numeric T>
DenseArray<T>::~DenseArray() {
    deallocate();
}

template <Numeric T>
typename DenseArray<T>::reference DenseArray<T>::at(const core::MultiIndex& indices) {
    if (indices.size() != dims_.size()) {
        throw core::DimensionMismatch(dims_.size(), indices.size());
    }
    for (size_type i = 0; i < dims_.size(); ++i) {
        if (indices[i] < 0 || static_cast<size_type>(indices[i]) >= dims_[i]) {
            throw core::OutOfBounds("dimension " + std::to_string(i) + " index " +
                                    std::to_string(indices[i]) + " of shape " + to_string(dims_));
        }
    }
    return data_[memory_offset(indices)];
}

template <Numeric T>
typename DenseArray<T>::const_reference DenseArray<T>::at(const core::MultiIndex& indices) const {
    return const_cast<DenseArray<T>*>(this)->at(indices);
}

template <Numeric T>
IndexStyle DenseArray<T>::index_style() const noexcept {
    // Row-major memory order does not follow the column-major linear order
    if (layout_ == MemoryLayout::ColumnMajor || dims_.size() <= 1) {
        return IndexStyle::Linear;
    }
    return IndexStyle::Cartesian;
}

template <Numeric T>
T DenseArray<T>::read(index_type linear) const {
    return data_[memory_offset(linear)];
}

template <Numeric T>
T DenseArray<T>::read(const core::MultiIndex& indices) const {
    return data_[memory_offset(indices)];
}

template <Numeric T>
void DenseArray<T>::write(index_type linear, T value) {
    data_[memory_offset(linear)] = value;
}

template <Numeric T>
void DenseArray<T>::write(const core::MultiIndex& indices, T value) {
    data_[memory_offset(indices)] = value;
}

template <Numeric T>
void DenseArray<T>::collect_storage_ids(std::vector<StorageId>& out, const Region& region) const {
    if (data_ == nullptr || is_empty(region)) {
        return;
    }
    core::MultiIndex lo(dims_.size());
    core::MultiIndex hi(dims_.size());
    for (size_type d = 0; d < dims_.size(); ++d) {
        lo[d] = d < region.size() ? region[d].lo : 0;
        hi[d] = d < region.size() ? region[d].hi : 0;
    }
    // Strides are positive, so the corners bound every element in between
    out.push_back({data_, memory_offset(lo), memory_offset(hi)});
}

template <Numeric T>
typename DenseArray<T>::size_type DenseArray<T>::alignment() const noexcept {
    switch (order_) {
    case MemoryOrder::Aligned64:
        return 64;
    case MemoryOrder::Aligned32:
        return 32;
    case MemoryOrder::Packed: // Packed and Native both use natural alignment.
    case MemoryOrder::Native:
    default:
        return std::alignment_of_v<T>;
    }
}

template <Numeric T>
void DenseArray<T>::zero() noexcept {
    fill(static_cast<T>(0));
}

template <Numeric T>
void DenseArray<T>::fill(T value) noexcept {
    if (data_ != nullptr) {
        std::fill(data_, data_ + size_, value);
    }
}

template <Numeric T>
void DenseArray<T>::assign(const std::vector<T>& values) {
    if (values.size() != size_) {
        throw std::invalid_argument("Expected " + std::to_string(size_) + " values, got " +
                                    std::to_string(values.size()));
    }
    for (size_type i = 0; i < size_; ++i) {
        write(static_cast<index_type>(i), values[i]);
    }
}

template <Numeric T>
std::vector<T> DenseArray<T>::to_vector() const {
    std::vector<T> values(size_);
    for (size_type i = 0; i < size_; ++i) {
        values[i] = read(static_cast<index_type>(i));
    }
    return values;
}

template <Numeric T>
void DenseArray<T>::allocate() {
    if (size_ == 0) {
        data_ = nullptr; // Handle empty arrays
        return;
    }
    data_ = allocate_aligned(size_, alignment());
    if (!data_) {
        throw std::runtime_error("Failed to allocate memory for array");
    }
}

template <Numeric T>
void DenseArray<T>::deallocate() noexcept {
    if (data_) {
        deallocate_aligned(data_, alignment());
        data_ = nullptr;
    }
}

template <Numeric T>
void DenseArray<T>::compute_strides() {
    const size_type rank = dims_.size();
    strides_.assign(rank, 1);
    if (rank == 0) {
        return;
    }

    if (layout_ == MemoryLayout::RowMajor) {
        for (size_type i = rank - 1; i > 0; --i) {
            strides_[i - 1] = strides_[i] * static_cast<index_type>(dims_[i]);
        }
    } else { // ColumnMajor
        for (size_type i = 1; i < rank; ++i) {
            strides_[i] = strides_[i - 1] * static_cast<index_type>(dims_[i - 1]);
        }
    }
}

template <Numeric T>
typename DenseArray<T>::index_type DenseArray<T>::memory_offset(
    const core::MultiIndex& indices) const noexcept {
    index_type offset = 0;
    for (size_type i = 0; i < dims_.size(); ++i) {
        offset += indices[i] * strides_[i];
    }
    return offset;
}

template <Numeric T>
typename DenseArray<T>::index_type DenseArray<T>::memory_offset(index_type linear) const {
    if (layout_ == MemoryLayout::ColumnMajor || dims_.size() <= 1) {
        return linear;
    }
    core::MultiIndex indices;
    core::linear_to_cartesian(dims_, linear, indices);
    return memory_offset(indices);
}

template <Numeric T>
typename DenseArray<T>::pointer DenseArray<T>::allocate_aligned(size_type size, size_type alignment) {
    // posix_memalign rejects alignments below the pointer size
    if (alignment < sizeof(void*)) {
        return new T[size];
    }
#ifdef _MSC_VER
    return static_cast<pointer>(_aligned_malloc(size * sizeof(T), alignment));
#else
    void* ptr;
    if (posix_memalign(&ptr, alignment, size * sizeof(T)) != 0) {
        return nullptr; // Allocation failed
    }
    return static_cast<pointer>(ptr);
#endif
}

template <Numeric T>
void DenseArray<T>::deallocate_aligned(pointer p, size_type alignment) noexcept {
    if (!p)
        return;

    if (alignment >= sizeof(void*)) {
#if defined(_MSC_VER)
        _aligned_free(p);
#else
        free(p); // Use standard free for posix_memalign
#endif
    } else {
        delete[] p;
    }
}

// Explicit instantiations for common types
template class DenseArray<float>;
template class DenseArray<double>;
template class DenseArray<int>;
template class DenseArray<unsigned int>;
template class DenseArray<long>;
template class DenseArray<unsigned long>;

} // namespace lattice::compute
