#pragma once

#include "lattice/common/types.hpp"
#include <cstddef>
#include <vector>

namespace lattice::compute {

using core::IndexStyle;
using core::Numeric;

// A closed interval of element positions inside one buffer. Two identities
// intersect when they name the same buffer and their intervals overlap.
struct StorageId {
    const void*    buffer;
    std::ptrdiff_t first;
    std::ptrdiff_t last;

    [[nodiscard]] bool overlaps(const StorageId& other) const noexcept {
        return buffer == other.buffer && first <= other.last && other.first <= last;
    }
};

// Closed per-dimension interval of positions
struct Extent {
    std::ptrdiff_t lo;
    std::ptrdiff_t hi;

    [[nodiscard]] bool empty() const noexcept {
        return hi < lo;
    }
};

using Region = std::vector<Extent>;

[[nodiscard]] inline Region full_region(const core::Shape& shape) {
    Region region;
    region.reserve(shape.size());
    for (std::size_t extent : shape) {
        region.push_back({0, static_cast<std::ptrdiff_t>(extent) - 1});
    }
    return region;
}

[[nodiscard]] inline bool is_empty(const Region& region) noexcept {
    for (const auto& extent : region) {
        if (extent.empty()) {
            return true;
        }
    }
    return false;
}

// Storage interface consumed by views. Linear positions are column-major.
// Element access through this interface is unchecked.
template <Numeric T>
class Container {
public:
    using value_type = T;
    using size_type  = std::size_t;
    using index_type = std::ptrdiff_t;

    virtual ~Container()                   = default;
    Container(const Container&)            = delete;
    Container& operator=(const Container&) = delete;

    [[nodiscard]] virtual const core::Shape& shape() const noexcept = 0;
    [[nodiscard]] virtual core::Strides      strides() const        = 0;
    [[nodiscard]] virtual IndexStyle         index_style() const noexcept = 0;

    [[nodiscard]] virtual T read(index_type linear) const                = 0;
    [[nodiscard]] virtual T read(const core::MultiIndex& indices) const  = 0;
    virtual void            write(index_type linear, T value)            = 0;
    virtual void            write(const core::MultiIndex& indices, T value) = 0;

    // Appends the identities of the storage behind the elements in `region`
    virtual void collect_storage_ids(std::vector<StorageId>& out, const Region& region) const = 0;

    [[nodiscard]] size_type rank() const noexcept {
        return shape().size();
    }
    [[nodiscard]] size_type size() const noexcept {
        return core::product(shape());
    }

    // Stride of dimension d; past the last dimension the array is treated as
    // having trailing singleton dimensions.
    [[nodiscard]] index_type stride(size_type d) const {
        const core::Strides s = strides();
        if (d < s.size()) {
            return s[d];
        }
        if (s.empty()) {
            return 1;
        }
        return s.back() * static_cast<index_type>(shape().back());
    }

protected:
    Container()                                = default;
    Container(Container&&) noexcept            = default;
    Container& operator=(Container&&) noexcept = default;
};

} // namespace lattice::compute
