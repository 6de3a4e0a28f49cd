#include "lattice/compute/reindex.hpp"
#include "lattice/common/errors.hpp"
#include <string>

namespace lattice::compute {

namespace {

// Positions selected by an inner index, plus the dimensions it contributes
struct Selection {
    std::vector<index_type> values;
    Shape                   dims;
    bool                    scalar = false;
};

Selection expand(const Index& index) {
    Selection sel;
    if (const auto* s = std::get_if<Scalar>(&index)) {
        sel.values.push_back(s->value);
        sel.scalar = true;
    } else if (const auto* slice = std::get_if<FullSlice>(&index)) {
        sel.values.resize(slice->extent);
        for (std::size_t k = 0; k < slice->extent; ++k) {
            sel.values[k] = static_cast<index_type>(k);
        }
        sel.dims.push_back(slice->extent);
    } else if (const auto* r = std::get_if<Range>(&index)) {
        sel.values.resize(r->length);
        for (std::size_t k = 0; k < r->length; ++k) {
            sel.values[k] = r->at(static_cast<index_type>(k));
        }
        sel.dims.push_back(r->length);
    } else {
        const auto& array = std::get<IndexArray>(index);
        if (array.width() != 1) {
            throw core::ReindexArityError("multi-index array used as a sub-index");
        }
        sel.values = array.values();
        sel.dims   = array.shape();
    }
    return sel;
}

Index compose_range(const Range& r, const Index& sub) {
    if (const auto* s = std::get_if<Scalar>(&sub)) {
        return Scalar{r.at(s->value)};
    }
    if (const auto* slice = std::get_if<FullSlice>(&sub)) {
        return Range{r.start, r.step, slice->extent};
    }
    if (const auto* q = std::get_if<Range>(&sub)) {
        return Range{r.at(q->start), r.step * q->step, q->length};
    }
    const auto& array = std::get<IndexArray>(sub);
    if (array.width() != 1) {
        throw core::ReindexArityError("multi-index array applied to a range");
    }
    std::vector<index_type> values(array.length());
    for (std::size_t k = 0; k < values.size(); ++k) {
        values[k] = r.at(array.value(k));
    }
    return IndexArray(std::move(values), array.shape());
}

// outer[subs...] for an index array of rank subs.size()
void gather(const IndexArray& outer, const Index* subs, std::vector<Index>& out) {
    const std::size_t      k = outer.rank();
    std::vector<Selection> selections;
    selections.reserve(k);
    Shape result_shape;
    bool  all_scalar_subs = true;
    for (std::size_t d = 0; d < k; ++d) {
        selections.push_back(expand(subs[d]));
        result_shape.insert(result_shape.end(),
                            selections.back().dims.begin(),
                            selections.back().dims.end());
        all_scalar_subs = all_scalar_subs && selections.back().scalar;
    }

    const std::size_t width = outer.width();
    if (all_scalar_subs) {
        MultiIndex position(k);
        for (std::size_t d = 0; d < k; ++d) {
            position[d] = selections[d].values[0];
        }
        const auto element = static_cast<std::size_t>(core::cartesian_to_linear(outer.shape(), position));
        for (std::size_t c = 0; c < width; ++c) {
            out.emplace_back(Scalar{outer.component(element, c)});
        }
        return;
    }

    // Walk the cartesian product of the selections, first one fastest
    const std::size_t       count = core::product(result_shape);
    std::vector<index_type> components;
    components.reserve(count * width);
    std::vector<std::size_t> cursor(k, 0);
    MultiIndex               position(k);
    for (std::size_t n = 0; n < count; ++n) {
        for (std::size_t d = 0; d < k; ++d) {
            position[d] = selections[d].values[cursor[d]];
        }
        const auto element = static_cast<std::size_t>(core::cartesian_to_linear(outer.shape(), position));
        for (std::size_t c = 0; c < width; ++c) {
            components.push_back(outer.component(element, c));
        }
        for (std::size_t d = 0; d < k; ++d) {
            if (++cursor[d] < selections[d].values.size()) {
                break;
            }
            cursor[d] = 0;
        }
    }

    if (width == 1) {
        out.emplace_back(IndexArray(std::move(components), std::move(result_shape)));
    } else {
        out.emplace_back(IndexArray::of_multi(std::move(components), width, std::move(result_shape)));
    }
}

[[noreturn]] void arity_error(std::size_t needed, std::size_t available) {
    throw core::ReindexArityError("needed " + std::to_string(needed) + " sub-indices, " +
                                  std::to_string(available) + " available");
}

} // namespace

std::vector<Index> reindex(const std::vector<Index>& outer, const std::vector<Index>& inner) {
    std::vector<Index> combined;
    combined.reserve(outer.size());

    std::size_t j = 0;
    for (const auto& index : outer) {
        const std::size_t remaining = inner.size() - j;

        if (is_scalar(index)) {
            combined.push_back(index);
        } else if (is_slice(index)) {
            if (remaining < 1) {
                arity_error(1, remaining);
            }
            combined.push_back(inner[j++]);
        } else if (const auto* r = std::get_if<Range>(&index)) {
            if (remaining < 1) {
                arity_error(1, remaining);
            }
            combined.push_back(compose_range(*r, inner[j++]));
        } else {
            const auto& array = std::get<IndexArray>(index);
            if (remaining < array.rank()) {
                arity_error(array.rank(), remaining);
            }
            gather(array, inner.data() + j, combined);
            j += array.rank();
        }
    }

    if (j != inner.size()) {
        throw core::ReindexArityError(std::to_string(inner.size() - j) + " sub-indices left over");
    }
    return combined;
}

void reindex_scalar(const std::vector<Index>& outer,
                    const index_type*         sub,
                    std::size_t               nsub,
                    MultiIndex&               out) {
    out.clear();
    std::size_t j = 0;
    for (const auto& index : outer) {
        if (const auto* s = std::get_if<Scalar>(&index)) {
            out.push_back(s->value);
            continue;
        }
        if (const auto* array = std::get_if<IndexArray>(&index)) {
            if (nsub - j < array->rank()) {
                arity_error(array->rank(), nsub - j);
            }
            const auto element =
                static_cast<std::size_t>(core::cartesian_to_linear(array->shape(), sub + j, array->rank()));
            j += array->rank();
            for (std::size_t c = 0; c < array->width(); ++c) {
                out.push_back(array->component(element, c));
            }
            continue;
        }
        if (j >= nsub) {
            arity_error(1, 0);
        }
        if (const auto* r = std::get_if<Range>(&index)) {
            out.push_back(r->at(sub[j++]));
        } else {
            out.push_back(sub[j++]);
        }
    }
    if (j != nsub) {
        throw core::ReindexArityError(std::to_string(nsub - j) + " sub-indices left over");
    }
}

bool needs_two_layers(const std::vector<Index>& inner) noexcept {
    for (const auto& index : inner) {
        if (const auto* array = std::get_if<IndexArray>(&index); array && array->width() != 1) {
            return true;
        }
    }
    return false;
}

} // namespace lattice::compute
