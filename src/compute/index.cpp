#include "lattice/compute/index.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace lattice::compute {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

// --- IndexArray Implementation ---

IndexArray::IndexArray(std::vector<index_type> values) : width_(1) {
    shape_ = {values.size()};
    data_  = std::make_shared<const std::vector<index_type>>(std::move(values));
}

IndexArray::IndexArray(std::vector<index_type> values, Shape shape)
    : shape_(std::move(shape)), width_(1) {
    if (values.size() != core::product(shape_)) {
        throw std::invalid_argument("Index array shape does not match number of values");
    }
    data_ = std::make_shared<const std::vector<index_type>>(std::move(values));
}

IndexArray::IndexArray(std::shared_ptr<const std::vector<index_type>> data,
                       Shape                                          shape,
                       std::size_t                                    width)
    : data_(std::move(data)), shape_(std::move(shape)), width_(width) {}

IndexArray IndexArray::of_multi(std::vector<index_type> components, std::size_t width, Shape shape) {
    if (components.size() != core::product(shape) * width) {
        throw std::invalid_argument("Multi-index array shape does not match number of components");
    }
    return IndexArray(std::make_shared<const std::vector<index_type>>(std::move(components)),
                      std::move(shape),
                      width);
}

IndexArray IndexArray::of_multi(const std::vector<MultiIndex>& elements, std::size_t width) {
    std::vector<index_type> components;
    components.reserve(elements.size() * width);
    for (const auto& element : elements) {
        if (element.size() != width) {
            throw std::invalid_argument("Multi-index element has wrong number of components");
        }
        components.insert(components.end(), element.begin(), element.end());
    }
    return of_multi(std::move(components), width, Shape{elements.size()});
}

std::pair<index_type, index_type> IndexArray::bounds(std::size_t c) const noexcept {
    index_type lo = component(0, c);
    index_type hi = lo;
    for (std::size_t k = 1; k < length(); ++k) {
        lo = std::min(lo, component(k, c));
        hi = std::max(hi, component(k, c));
    }
    return {lo, hi};
}

// --- Index queries ---

std::size_t consumed_dims(const Index& index) noexcept {
    if (const auto* array = std::get_if<IndexArray>(&index)) {
        return array->width();
    }
    return 1;
}

std::size_t total_consumed(const std::vector<Index>& indices) noexcept {
    std::size_t n = 0;
    for (const auto& index : indices) {
        n += consumed_dims(index);
    }
    return n;
}

std::size_t contributed_dims(const Index& index) noexcept {
    return std::visit(overloaded{[](const Scalar&) -> std::size_t { return 0; },
                                 [](const FullSlice&) -> std::size_t { return 1; },
                                 [](const Range&) -> std::size_t { return 1; },
                                 [](const IndexArray& a) -> std::size_t { return a.rank(); }},
                      index);
}

void append_shape(const Index& index, Shape& shape) {
    std::visit(overloaded{[](const Scalar&) {},
                          [&](const FullSlice& s) {
                              if (!s.is_resolved()) {
                                  throw std::logic_error("FullSlice extent was never resolved");
                              }
                              shape.push_back(s.extent);
                          },
                          [&](const Range& r) { shape.push_back(r.length); },
                          [&](const IndexArray& a) {
                              shape.insert(shape.end(), a.shape().begin(), a.shape().end());
                          }},
               index);
}

Shape view_shape(const std::vector<Index>& indices) {
    Shape shape;
    for (const auto& index : indices) {
        append_shape(index, shape);
    }
    return shape;
}

std::size_t selection_length(const Index& index) noexcept {
    return std::visit(overloaded{[](const Scalar&) -> std::size_t { return 1; },
                                 [](const FullSlice& s) -> std::size_t { return s.extent; },
                                 [](const Range& r) -> std::size_t { return r.length; },
                                 [](const IndexArray& a) -> std::size_t { return a.length(); }},
                      index);
}

index_type first_value(const Index& index) noexcept {
    return std::visit(
        overloaded{[](const Scalar& s) { return s.value; },
                   [](const FullSlice&) -> index_type { return 0; },
                   [](const Range& r) { return r.start; },
                   [](const IndexArray& a) -> index_type {
                       return (a.empty() || a.width() == 0) ? 0 : a.component(0, 0);
                   }},
        index);
}

bool all_scalar(const std::vector<Index>& indices, std::size_t from) noexcept {
    for (std::size_t i = from; i < indices.size(); ++i) {
        if (!is_scalar(indices[i])) {
            return false;
        }
    }
    return true;
}

std::vector<Index> resolve_indices(const Shape& shape, std::vector<Index> indices) {
    std::size_t dim = 0;
    for (std::size_t i = 0; i < indices.size(); ++i) {
        const bool last = (i + 1 == indices.size());
        if (auto* slice = std::get_if<FullSlice>(&indices[i]); slice && !slice->is_resolved()) {
            std::size_t extent = dim < shape.size() ? shape[dim] : 1;
            if (last) {
                // Trailing dimensions fold into the final slice
                for (std::size_t d = dim + 1; d < shape.size(); ++d) {
                    extent *= shape[d];
                }
            }
            slice->extent = extent;
        }
        dim += consumed_dims(indices[i]);
    }
    return indices;
}

std::string to_string(const Index& index) {
    std::ostringstream os;
    std::visit(overloaded{[&](const Scalar& s) { os << s.value; },
                          [&](const FullSlice& s) {
                              os << ':';
                              if (s.is_resolved()) {
                                  os << s.extent;
                              }
                          },
                          [&](const Range& r) {
                              os << r.start << ':' << r.step << ':' << r.length;
                          },
                          [&](const IndexArray& a) {
                              os << "IndexArray" << to_string(a.shape());
                              if (a.width() != 1) {
                                  os << "{width=" << a.width() << '}';
                              }
                          }},
               index);
    return os.str();
}

std::string to_string(const std::vector<Index>& indices) {
    std::string out = "(";
    for (std::size_t i = 0; i < indices.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += to_string(indices[i]);
    }
    return out + ")";
}

std::string to_string(const Shape& shape) {
    std::string out = "[";
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += std::to_string(shape[i]);
    }
    return out + "]";
}

} // namespace lattice::compute
