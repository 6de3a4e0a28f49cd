#pragma once

#include "lattice/common/types.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace lattice::compute {

using core::IndexStyle;
using core::MultiIndex;
using core::Shape;
using core::Strides;
using index_type = std::ptrdiff_t;

// Selects one position; the dimension is dropped from the view
struct Scalar {
    index_type value;
};

// Selects a whole axis. An unresolved extent is filled in from the parent.
struct FullSlice {
    static constexpr std::size_t unresolved = static_cast<std::size_t>(-1);
    std::size_t                  extent     = unresolved;

    [[nodiscard]] bool is_resolved() const noexcept {
        return extent != unresolved;
    }
};

// start, start + step, ..., start + step * (length - 1)
struct Range {
    index_type  start;
    index_type  step;
    std::size_t length;

    [[nodiscard]] index_type at(index_type k) const noexcept {
        return start + step * k;
    }
    [[nodiscard]] index_type last() const noexcept {
        return at(static_cast<index_type>(length) - 1);
    }
    [[nodiscard]] bool is_unit() const noexcept {
        return step == 1;
    }
};

// An array of indices with a shape of its own. Each element is `width`
// integers: 1 for plain integer indices, N for N-dimensional multi-indices.
// Elements are stored in column-major order of `shape`.
class IndexArray {
public:
    explicit IndexArray(std::vector<index_type> values);
    IndexArray(std::vector<index_type> values, Shape shape);

    // `components` holds `width` integers per element
    [[nodiscard]] static IndexArray of_multi(std::vector<index_type> components,
                                             std::size_t             width,
                                             Shape                   shape);
    [[nodiscard]] static IndexArray of_multi(const std::vector<MultiIndex>& elements,
                                             std::size_t                    width);

    [[nodiscard]] const Shape& shape() const noexcept {
        return shape_;
    }
    [[nodiscard]] std::size_t rank() const noexcept {
        return shape_.size();
    }
    [[nodiscard]] std::size_t width() const noexcept {
        return width_;
    }
    [[nodiscard]] std::size_t length() const noexcept {
        return core::product(shape_);
    }
    [[nodiscard]] bool empty() const noexcept {
        return length() == 0;
    }
    [[nodiscard]] index_type component(std::size_t element, std::size_t c) const noexcept {
        return (*data_)[element * width_ + c];
    }
    [[nodiscard]] index_type value(std::size_t element) const noexcept {
        return (*data_)[element];
    }
    [[nodiscard]] const std::vector<index_type>& values() const noexcept {
        return *data_;
    }

    // Identity of the shared integer buffer
    [[nodiscard]] const void* storage() const noexcept {
        return data_.get();
    }

    // Smallest and largest value of component `c`; undefined for empty arrays
    [[nodiscard]] std::pair<index_type, index_type> bounds(std::size_t c) const noexcept;

private:
    IndexArray(std::shared_ptr<const std::vector<index_type>> data, Shape shape, std::size_t width);

    std::shared_ptr<const std::vector<index_type>> data_;
    Shape                                          shape_;
    std::size_t                                    width_;
};

using Index = std::variant<Scalar, FullSlice, Range, IndexArray>;

// Parent dimensions addressed by the index
[[nodiscard]] std::size_t consumed_dims(const Index& index) noexcept;
[[nodiscard]] std::size_t total_consumed(const std::vector<Index>& indices) noexcept;

// Dimensions the index contributes to the view
[[nodiscard]] std::size_t contributed_dims(const Index& index) noexcept;

void                append_shape(const Index& index, Shape& shape);
[[nodiscard]] Shape view_shape(const std::vector<Index>& indices);

// Number of positions selected
[[nodiscard]] std::size_t selection_length(const Index& index) noexcept;

// First selected position (component 0 for multi-index arrays)
[[nodiscard]] index_type first_value(const Index& index) noexcept;

[[nodiscard]] inline bool is_scalar(const Index& index) noexcept {
    return std::holds_alternative<Scalar>(index);
}
[[nodiscard]] inline bool is_slice(const Index& index) noexcept {
    return std::holds_alternative<FullSlice>(index);
}
[[nodiscard]] inline bool is_range(const Index& index) noexcept {
    return std::holds_alternative<Range>(index);
}
[[nodiscard]] inline bool is_array(const Index& index) noexcept {
    return std::holds_alternative<IndexArray>(index);
}

[[nodiscard]] bool all_scalar(const std::vector<Index>& indices, std::size_t from = 0) noexcept;

// Fills unresolved FullSlice extents from `shape`. When fewer indices than
// dimensions are given, the last index spans the remaining dimensions.
[[nodiscard]] std::vector<Index> resolve_indices(const Shape& shape, std::vector<Index> indices);

[[nodiscard]] std::string to_string(const Index& index);
[[nodiscard]] std::string to_string(const std::vector<Index>& indices);
[[nodiscard]] std::string to_string(const Shape& shape);

} // namespace lattice::compute
