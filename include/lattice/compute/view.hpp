#pragma once

#include "lattice/compute/container.hpp"
#include "lattice/compute/dense_array.hpp"
#include "lattice/compute/index.hpp"
#include "lattice/compute/index_plan.hpp"
#include <concepts>
#include <memory>
#include <vector>

namespace lattice::compute {

// Lazy window into a parent container selected by one index per parent
// dimension. The parent's storage is shared, never copied; writes go through
// to the parent. Indices, plan, offset and stride are fixed at construction.
//
// get/set validate their arguments and throw OutOfBounds. unsafe_get and
// unsafe_set skip validation; out-of-range arguments are undefined behavior.
//
// Concurrent readers are fine. Writers need external synchronization against
// every other user of the same or aliasing storage.
template <Numeric T>
class View final : public Container<T> {
    // Restricts construction to View::construct
    class Key {
        explicit Key() = default;
        friend class View;
    };

public:
    using value_type     = T;
    using size_type      = std::size_t;
    using index_type     = std::ptrdiff_t;
    using parent_pointer = std::shared_ptr<Container<T>>;

    // Throws DimensionMismatch unless the indices address exactly
    // parent->rank() dimensions. No bounds checking is performed.
    [[nodiscard]] static std::shared_ptr<View<T>> construct(parent_pointer     parent,
                                                            std::vector<Index> indices);

    View(Key                key,
         parent_pointer     parent,
         std::vector<Index> indices,
         IndexPlan          plan,
         index_type         offset1,
         index_type         stride1);

    // Container interface (unchecked)
    [[nodiscard]] const core::Shape& shape() const noexcept override {
        return shape_;
    }
    [[nodiscard]] core::Strides strides() const override;
    [[nodiscard]] IndexStyle    index_style() const noexcept override {
        return plan_.style;
    }
    [[nodiscard]] T read(index_type linear) const override {
        return unsafe_get(linear);
    }
    [[nodiscard]] T read(const core::MultiIndex& indices) const override {
        return unsafe_get(indices);
    }
    void write(index_type linear, T value) override {
        unsafe_set(linear, value);
    }
    void write(const core::MultiIndex& indices, T value) override {
        unsafe_set(indices, value);
    }
    void collect_storage_ids(std::vector<StorageId>& out, const Region& region) const override;

    // Checked access
    [[nodiscard]] T get(index_type linear) const;
    [[nodiscard]] T get(const core::MultiIndex& indices) const;
    void            set(index_type linear, T value);
    void            set(const core::MultiIndex& indices, T value);

    template <typename... Indices>
    T operator()(Indices... indices) const {
        core::MultiIndex idx = {static_cast<index_type>(indices)...};
        return get(idx);
    }

    // Unchecked access
    [[nodiscard]] T unsafe_get(index_type linear) const;
    [[nodiscard]] T unsafe_get(const core::MultiIndex& indices) const;
    void            unsafe_set(index_type linear, T value);
    void            unsafe_set(const core::MultiIndex& indices, T value);

    // The two addressing paths, usable side by side. read_linear_fast throws
    // NonStridedViewError on views that are not fast.
    [[nodiscard]] T read_linear_fast(index_type linear) const;
    [[nodiscard]] T read_reindexed(const core::MultiIndex& indices) const;

    [[nodiscard]] bool is_fast() const noexcept {
        return plan_.fast;
    }
    [[nodiscard]] bool is_contiguous() const noexcept {
        return plan_.contiguous;
    }
    [[nodiscard]] const IndexPlan& plan() const noexcept {
        return plan_;
    }

    // Parent linear index of element 0 and the distance between consecutive
    // elements. Both throw NonStridedViewError unless the view is fast.
    [[nodiscard]] index_type offset() const;
    [[nodiscard]] index_type stride1() const;

    // Parent linear index of the first element
    [[nodiscard]] index_type first_index() const;

    [[nodiscard]] const parent_pointer& parent() const noexcept {
        return parent_;
    }
    [[nodiscard]] const std::vector<Index>& parent_indices() const noexcept {
        return indices_;
    }

    void fill(T value);

    // Materializes the view into `dest`, which must have the view's shape
    void copy_to(DenseArray<T>& dest) const;

private:
    [[nodiscard]] index_type parent_linear(index_type linear) const noexcept {
        return plan_.contiguous ? offset1_ + linear : offset1_ + stride1_ * linear;
    }

    parent_pointer     parent_;
    std::vector<Index> indices_;
    IndexPlan          plan_;
    index_type         offset1_; // valid iff plan_.fast
    index_type         stride1_; // valid iff plan_.fast
    core::Shape        shape_;
};

enum class BoundsCheck {
    Default, // follow config::checked_by_default()
    Checked,
    Unchecked
};

// Builds a view of `parent`. Unresolved slices are resolved, indices are
// bounds checked unless disabled, trailing scalar indices past the parent's
// rank are dropped, and the parent is reshaped when the index count differs
// from its rank. Views of views collapse into a single layer over the
// underlying parent, except when `indices` holds an array of multi-indices.
template <Numeric T>
[[nodiscard]] std::shared_ptr<View<T>> view(std::shared_ptr<Container<T>> parent,
                                            std::vector<Index>            indices,
                                            BoundsCheck check = BoundsCheck::Default);

// Accepts a pointer to any concrete container type
template <typename C>
    requires std::derived_from<C, Container<typename C::value_type>>
[[nodiscard]] std::shared_ptr<View<typename C::value_type>> view(std::shared_ptr<C>  parent,
                                                                 std::vector<Index> indices,
                                                                 BoundsCheck check = BoundsCheck::Default) {
    using T = typename C::value_type;
    return view<T>(std::shared_ptr<Container<T>>(std::move(parent)), std::move(indices), check);
}

} // namespace lattice::compute
