#pragma once

#include "lattice/compute/index.hpp"
#include <cstddef>
#include <vector>

namespace lattice::compute {

// Composes a view's indices (`outer`, addressing the parent) with indices
// into the view (`inner`), giving one index list against the parent:
// A[i, j][x, y] becomes A[i[x], j[y]].
//
//  * Scalar outer index: the dimension was dropped, kept as is, no inner index consumed.
//  * FullSlice: the next inner index passes through verbatim.
//  * Range: composed arithmetically with the next inner index.
//  * IndexArray of rank k: gathered with the next k inner indices. A gathered
//    multi-index element expands into one scalar per component.
//
// Throws ReindexArityError when the inner list does not match the view's rank.
[[nodiscard]] std::vector<Index> reindex(const std::vector<Index>& outer,
                                         const std::vector<Index>& inner);

// Element-access form where every inner index is an integer. `out` receives
// one integer per parent dimension.
void reindex_scalar(const std::vector<Index>& outer,
                    const index_type*         sub,
                    std::size_t               nsub,
                    MultiIndex&               out);

// Arrays of multi-indices may span several of the view's dimensions, which a
// flat substitution cannot express; such index lists keep two layers.
[[nodiscard]] bool needs_two_layers(const std::vector<Index>& inner) noexcept;

} // namespace lattice::compute
