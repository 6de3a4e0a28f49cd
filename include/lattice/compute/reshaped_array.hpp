#pragma once

#include "lattice/compute/container.hpp"
#include <memory>

namespace lattice::compute {

// Presents a parent under a different shape of the same length. Column-major
// linear positions are shared with the parent, so nothing is copied.
template <Numeric T>
class ReshapedArray final : public Container<T> {
public:
    using index_type     = std::ptrdiff_t;
    using parent_pointer = std::shared_ptr<Container<T>>;

    ReshapedArray(parent_pointer parent, core::Shape dims);

    [[nodiscard]] const core::Shape& shape() const noexcept override {
        return dims_;
    }
    [[nodiscard]] core::Strides strides() const override;
    [[nodiscard]] IndexStyle    index_style() const noexcept override {
        return parent_->index_style();
    }

    [[nodiscard]] T read(index_type linear) const override;
    [[nodiscard]] T read(const core::MultiIndex& indices) const override;
    void            write(index_type linear, T value) override;
    void            write(const core::MultiIndex& indices, T value) override;

    void collect_storage_ids(std::vector<StorageId>& out, const Region& region) const override;

    [[nodiscard]] const parent_pointer& parent() const noexcept {
        return parent_;
    }

private:
    parent_pointer parent_;
    core::Shape    dims_;
};

// Shape with `n` dimensions covering `shape`: trailing dimensions are merged
// into the last one, or singleton dimensions are appended.
[[nodiscard]] core::Shape reshape_to(const core::Shape& shape, std::size_t n);

} // namespace lattice::compute
