#include "lattice/compute/view.hpp"
#include "lattice/common/config.hpp"
#include "lattice/common/errors.hpp"
#include "lattice/common/logging.hpp"
#include "lattice/compute/bounds.hpp"
#include "lattice/compute/reindex.hpp"
#include "lattice/compute/reshaped_array.hpp"
#include "lattice/compute/strides.hpp"
#include <algorithm>
#include <stdexcept>

namespace lattice::compute {

namespace {

// Fills unresolved slices from the parent's axes and rewrites slices that do
// not cover their axis as unit ranges.
std::vector<Index> normalize(const Shape& shape, std::vector<Index> indices) {
    std::size_t dim = 0;
    for (auto& index : indices) {
        if (auto* slice = std::get_if<FullSlice>(&index)) {
            const std::size_t axis = dim < shape.size() ? shape[dim] : 1;
            if (!slice->is_resolved()) {
                slice->extent = axis;
            } else if (slice->extent != axis) {
                index = Range{0, 1, slice->extent};
            }
        }
        dim += consumed_dims(index);
    }
    return indices;
}

// Scalars past the parent's last dimension select nothing new
std::vector<Index> drop_trailing_singletons(std::size_t rank, std::vector<Index> indices) {
    std::vector<Index> kept;
    kept.reserve(indices.size());
    std::size_t remaining = rank;
    for (auto& index : indices) {
        if (remaining == 0 && is_scalar(index)) {
            continue;
        }
        const std::size_t n = consumed_dims(index);
        remaining           = n >= remaining ? 0 : remaining - n;
        kept.push_back(std::move(index));
    }
    return kept;
}

} // namespace

// --- View Implementation ---

template <Numeric T>
View<T>::View(Key /*key*/,
              parent_pointer     parent,
              std::vector<Index> indices,
              IndexPlan          plan,
              index_type         offset1,
              index_type         stride1)
    : parent_(std::move(parent)), indices_(std::move(indices)), plan_(plan), offset1_(offset1),
      stride1_(stride1), shape_(view_shape(indices_)) {}

template <Numeric T>
std::shared_ptr<View<T>> View<T>::construct(parent_pointer parent, std::vector<Index> indices) {
    if (!parent) {
        throw std::invalid_argument("View parent must not be null");
    }
    const std::size_t consumed = total_consumed(indices);
    if (consumed != parent->rank()) {
        LOG_ERROR("View construction failed: ",
                  consumed,
                  " indices for a parent of rank ",
                  parent->rank());
        throw core::DimensionMismatch(parent->rank(), consumed);
    }

    indices              = normalize(parent->shape(), std::move(indices));
    const IndexPlan plan = classify(indices, parent->index_style());

    index_type stride1 = 0;
    index_type offset1 = 0;
    if (plan.fast) {
        stride1 = compute_stride1(parent->shape(), indices);
        offset1 = compute_offset1(parent->shape(), stride1, indices);
    }

    if (logging::Logger::fastPathLoggingEnabled()) {
        LOG_FASTPATH("View",
                     to_string(plan),
                     "indices=",
                     to_string(indices),
                     " parent=",
                     to_string(parent->shape()),
                     " offset=",
                     offset1,
                     " stride=",
                     stride1);
    }

    return std::make_shared<View<T>>(
        Key{}, std::move(parent), std::move(indices), plan, offset1, stride1);
}

template <Numeric T>
core::Strides View<T>::strides() const {
    return substrides(parent_->strides(), indices_);
}

template <Numeric T>
void View<T>::collect_storage_ids(std::vector<StorageId>& out, const Region& region) const {
    // Index arrays are read on every access
    for (const auto& index : indices_) {
        if (const auto* array = std::get_if<IndexArray>(&index); array && !array->values().empty()) {
            out.push_back({array->storage(),
                           0,
                           static_cast<index_type>(array->values().size()) - 1});
        }
    }
    if (is_empty(region)) {
        return;
    }

    Region      parent_region;
    std::size_t vd = 0;
    for (const auto& index : indices_) {
        if (const auto* s = std::get_if<Scalar>(&index)) {
            parent_region.push_back({s->value, s->value});
        } else if (std::holds_alternative<FullSlice>(index)) {
            parent_region.push_back(region[vd++]);
        } else if (const auto* r = std::get_if<Range>(&index)) {
            const index_type a = r->at(region[vd].lo);
            const index_type b = r->at(region[vd].hi);
            parent_region.push_back({std::min(a, b), std::max(a, b)});
            ++vd;
        } else {
            // Bounds of each component over the elements inside the sub-box
            const auto&       array = std::get<IndexArray>(index);
            const std::size_t k     = array.rank();
            Region            bounds(array.width(), Extent{0, -1});
            core::MultiIndex  position(k);
            for (std::size_t d = 0; d < k; ++d) {
                position[d] = region[vd + d].lo;
            }
            while (true) {
                const auto element =
                    static_cast<std::size_t>(core::cartesian_to_linear(array.shape(), position));
                for (std::size_t c = 0; c < array.width(); ++c) {
                    const index_type v = array.component(element, c);
                    if (bounds[c].empty()) {
                        bounds[c] = {v, v};
                    } else {
                        bounds[c] = {std::min(bounds[c].lo, v), std::max(bounds[c].hi, v)};
                    }
                }
                std::size_t d = 0;
                for (; d < k; ++d) {
                    if (++position[d] <= region[vd + d].hi) {
                        break;
                    }
                    position[d] = region[vd + d].lo;
                }
                if (d == k) {
                    break;
                }
            }
            parent_region.insert(parent_region.end(), bounds.begin(), bounds.end());
            vd += k;
        }
    }
    parent_->collect_storage_ids(out, parent_region);
}

template <Numeric T>
T View<T>::get(index_type linear) const {
    checkbounds(shape_, linear);
    return unsafe_get(linear);
}

template <Numeric T>
T View<T>::get(const core::MultiIndex& indices) const {
    checkbounds(shape_, indices);
    return unsafe_get(indices);
}

template <Numeric T>
void View<T>::set(index_type linear, T value) {
    checkbounds(shape_, linear);
    unsafe_set(linear, value);
}

template <Numeric T>
void View<T>::set(const core::MultiIndex& indices, T value) {
    checkbounds(shape_, indices);
    unsafe_set(indices, value);
}

template <Numeric T>
T View<T>::unsafe_get(index_type linear) const {
    if (plan_.fast) {
        return parent_->read(parent_linear(linear));
    }
    core::MultiIndex indices;
    core::linear_to_cartesian(shape_, linear, indices);
    return read_reindexed(indices);
}

template <Numeric T>
T View<T>::unsafe_get(const core::MultiIndex& indices) const {
    if (plan_.fast && indices.size() == 1) {
        return parent_->read(parent_linear(indices[0]));
    }
    return read_reindexed(indices);
}

template <Numeric T>
void View<T>::unsafe_set(index_type linear, T value) {
    if (plan_.fast) {
        parent_->write(parent_linear(linear), value);
        return;
    }
    core::MultiIndex indices;
    core::linear_to_cartesian(shape_, linear, indices);
    unsafe_set(indices, value);
}

template <Numeric T>
void View<T>::unsafe_set(const core::MultiIndex& indices, T value) {
    if (plan_.fast && indices.size() == 1) {
        parent_->write(parent_linear(indices[0]), value);
        return;
    }
    core::MultiIndex parent_indices;
    reindex_scalar(indices_, indices.data(), indices.size(), parent_indices);
    parent_->write(parent_indices, value);
}

template <Numeric T>
T View<T>::read_linear_fast(index_type linear) const {
    if (!plan_.fast) {
        throw core::NonStridedViewError(to_string(indices_));
    }
    return parent_->read(parent_linear(linear));
}

template <Numeric T>
T View<T>::read_reindexed(const core::MultiIndex& indices) const {
    core::MultiIndex parent_indices;
    reindex_scalar(indices_, indices.data(), indices.size(), parent_indices);
    return parent_->read(parent_indices);
}

template <Numeric T>
typename View<T>::index_type View<T>::offset() const {
    if (!plan_.fast) {
        throw core::NonStridedViewError(to_string(indices_));
    }
    return offset1_;
}

template <Numeric T>
typename View<T>::index_type View<T>::stride1() const {
    if (!plan_.fast) {
        throw core::NonStridedViewError(to_string(indices_));
    }
    return stride1_;
}

template <Numeric T>
typename View<T>::index_type View<T>::first_index() const {
    if (plan_.fast) {
        return offset1_;
    }
    return compute_linindex(parent_->shape(), indices_);
}

template <Numeric T>
void View<T>::fill(T value) {
    const auto n = static_cast<index_type>(this->size());
    for (index_type i = 0; i < n; ++i) {
        unsafe_set(i, value);
    }
}

template <Numeric T>
void View<T>::copy_to(DenseArray<T>& dest) const {
    if (dest.shape() != shape_) {
        throw std::invalid_argument("Destination shape " + to_string(dest.shape()) +
                                    " does not match view shape " + to_string(shape_));
    }
    const auto n = static_cast<index_type>(this->size());
    for (index_type i = 0; i < n; ++i) {
        dest.write(i, unsafe_get(i));
    }
}

// --- view() entry point ---

template <Numeric T>
std::shared_ptr<View<T>> view(std::shared_ptr<Container<T>> parent,
                              std::vector<Index>            indices,
                              BoundsCheck                   check) {
    if (!parent) {
        throw std::invalid_argument("View parent must not be null");
    }
    indices = resolve_indices(parent->shape(), std::move(indices));

    const bool checked = check == BoundsCheck::Checked ||
                         (check == BoundsCheck::Default && config::checked_by_default());
    if (checked) {
        checkbounds(parent->shape(), indices);
    }

    indices = drop_trailing_singletons(parent->rank(), std::move(indices));

    const std::size_t consumed = total_consumed(indices);
    if (consumed != parent->rank()) {
        LOG_DEBUG("Reshaping parent ",
                  to_string(parent->shape()),
                  " to ",
                  consumed,
                  " dimensions for indices ",
                  to_string(indices));
        core::Shape dims = reshape_to(parent->shape(), consumed);
        parent = std::make_shared<ReshapedArray<T>>(std::move(parent), std::move(dims));
    }

    if (auto inner = std::dynamic_pointer_cast<View<T>>(parent)) {
        if (!needs_two_layers(indices)) {
            return View<T>::construct(inner->parent(), reindex(inner->parent_indices(), indices));
        }
        LOG_DEBUG("Keeping two layers of indirection for ", to_string(indices));
    }
    return View<T>::construct(std::move(parent), std::move(indices));
}

// Explicit instantiations for common types
template class View<float>;
template class View<double>;
template class View<int>;
template class View<unsigned int>;
template class View<long>;
template class View<unsigned long>;

template std::shared_ptr<View<float>>  view<float>(std::shared_ptr<Container<float>>, std::vector<Index>, BoundsCheck);
template std::shared_ptr<View<double>> view<double>(std::shared_ptr<Container<double>>, std::vector<Index>, BoundsCheck);
template std::shared_ptr<View<int>>    view<int>(std::shared_ptr<Container<int>>, std::vector<Index>, BoundsCheck);
template std::shared_ptr<View<unsigned int>>  view<unsigned int>(std::shared_ptr<Container<unsigned int>>, std::vector<Index>, BoundsCheck);
template std::shared_ptr<View<long>>          view<long>(std::shared_ptr<Container<long>>, std::vector<Index>, BoundsCheck);
template std::shared_ptr<View<unsigned long>> view<unsigned long>(std::shared_ptr<Container<unsigned long>>, std::vector<Index>, BoundsCheck);

} // namespace lattice::compute
