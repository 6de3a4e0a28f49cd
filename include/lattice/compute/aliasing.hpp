#pragma once

#include "lattice/compute/container.hpp"
#include "lattice/compute/view.hpp"
#include <memory>
#include <vector>

namespace lattice::compute {

// Storage touched by the elements of `container`, including the buffers of
// any index arrays it reads through
template <Numeric T>
[[nodiscard]] std::vector<StorageId> storage_identities(const Container<T>& container);

[[nodiscard]] bool ids_intersect(const std::vector<StorageId>& a, const std::vector<StorageId>& b) noexcept;

// Conservative: true whenever the two may share an element
template <Numeric T>
[[nodiscard]] bool may_alias(const Container<T>& a, const Container<T>& b);

// Dense private copy of the elements `source` selects, wrapped in a view with
// densified indices and the same shape
template <Numeric T>
[[nodiscard]] std::shared_ptr<View<T>> defensive_copy(const View<T>& source);

// `source` itself, or a defensive copy of it when it may alias `dest`
template <Numeric T>
[[nodiscard]] std::shared_ptr<View<T>> unalias(const Container<T>& dest, std::shared_ptr<View<T>> source);

} // namespace lattice::compute
