#pragma once

#include "lattice/compute/container.hpp"
#include <array>
#include <cstddef>
#include <initializer_list>
#include <vector>

namespace lattice::compute {

using core::MemoryLayout;
using core::MemoryOrder;

// Owning aligned buffer. Column-major arrays are linear-fast; row-major
// arrays are addressed through their cartesian strides.
template <Numeric T>
class DenseArray final : public Container<T> {
public:
    static constexpr std::size_t MAX_DIMS = 8;
    using value_type                      = T;
    using size_type                       = std::size_t;
    using index_type                      = std::ptrdiff_t;
    using pointer                         = T*;
    using const_pointer                   = const T*;
    using reference                       = T&;
    using const_reference                 = const T&;

    explicit DenseArray(std::initializer_list<size_type> dims,
                        MemoryLayout                     layout = MemoryLayout::ColumnMajor,
                        MemoryOrder                      order  = MemoryOrder::Aligned64);

    explicit DenseArray(const core::Shape& dims,
                        MemoryLayout       layout = MemoryLayout::ColumnMajor,
                        MemoryOrder        order  = MemoryOrder::Aligned64);

    DenseArray(DenseArray&& other) noexcept;
    DenseArray& operator=(DenseArray&& other) noexcept;

    ~DenseArray() override;

    pointer data() noexcept {
        return data_;
    }
    const_pointer data() const noexcept {
        return data_;
    }

    // Bounds-checked element reference
    reference       at(const core::MultiIndex& indices);
    const_reference at(const core::MultiIndex& indices) const;

    template <typename... Indices>
    reference operator()(Indices... indices) {
        static_assert(sizeof...(Indices) <= MAX_DIMS, "Too many indices");
        core::MultiIndex idx = {static_cast<index_type>(indices)...};
        return at(idx);
    }

    template <typename... Indices>
    const_reference operator()(Indices... indices) const {
        static_assert(sizeof...(Indices) <= MAX_DIMS, "Too many indices");
        core::MultiIndex idx = {static_cast<index_type>(indices)...};
        return at(idx);
    }

    // Container interface
    [[nodiscard]] const core::Shape& shape() const noexcept override {
        return dims_;
    }
    [[nodiscard]] core::Strides strides() const override {
        return strides_;
    }
    [[nodiscard]] IndexStyle index_style() const noexcept override;

    [[nodiscard]] T read(index_type linear) const override;
    [[nodiscard]] T read(const core::MultiIndex& indices) const override;
    void            write(index_type linear, T value) override;
    void            write(const core::MultiIndex& indices, T value) override;

    void collect_storage_ids(std::vector<StorageId>& out, const Region& region) const override;

    // Properties
    [[nodiscard]] MemoryLayout layout() const noexcept {
        return layout_;
    }
    [[nodiscard]] MemoryOrder order() const noexcept {
        return order_;
    }
    [[nodiscard]] size_type alignment() const noexcept;

    // Memory operations
    void zero() noexcept;
    void fill(T value) noexcept;

    // Assigns `values` in column-major logical order
    void assign(const std::vector<T>& values);

    [[nodiscard]] std::vector<T> to_vector() const;

private:
    pointer       data_;
    core::Shape   dims_;
    core::Strides strides_;
    size_type     size_;
    MemoryLayout  layout_;
    MemoryOrder   order_;

    void                     allocate();
    void                     deallocate() noexcept;
    void                     compute_strides();
    [[nodiscard]] index_type memory_offset(const core::MultiIndex& indices) const noexcept;
    [[nodiscard]] index_type memory_offset(index_type linear) const;
    static pointer           allocate_aligned(size_type size, size_type alignment);
    static void              deallocate_aligned(pointer p, size_type alignment) noexcept;
};

} // namespace lattice::compute
