#include "lattice/compute/index.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <type_traits>
#include <vector>

using namespace lattice::compute;

TEST(IndexTest, DimensionCounts) {
    EXPECT_EQ(consumed_dims(Scalar{3}), 1u);
    EXPECT_EQ(contributed_dims(Scalar{3}), 0u);
    EXPECT_EQ(contributed_dims(FullSlice{4}), 1u);
    EXPECT_EQ(contributed_dims(Range{0, 2, 3}), 1u);

    IndexArray plain({0, 1, 2, 3, 4, 5}, Shape{2, 3});
    EXPECT_EQ(consumed_dims(plain), 1u);
    EXPECT_EQ(contributed_dims(plain), 2u);

    auto multi = IndexArray::of_multi({{0, 1, 2}, {1, 1, 1}}, 3);
    EXPECT_EQ(consumed_dims(multi), 3u);
    EXPECT_EQ(contributed_dims(multi), 1u);

    std::vector<Index> indices = {Scalar{0}, multi, FullSlice{2}};
    EXPECT_EQ(total_consumed(indices), 5u);
    EXPECT_EQ(view_shape(indices), (Shape{2, 2}));
}

TEST(IndexTest, RangeArithmetic) {
    Range r{3, -2, 4};
    EXPECT_EQ(r.at(0), 3);
    EXPECT_EQ(r.last(), -3);
    EXPECT_FALSE(r.is_unit());
    EXPECT_TRUE((Range{0, 1, 0}).is_unit());
    EXPECT_EQ(selection_length(r), 4u);
    EXPECT_EQ(first_value(r), 3);
}

TEST(IndexTest, IndexArrayStorage) {
    IndexArray a({4, 1, 7});
    EXPECT_EQ(a.shape(), (Shape{3}));
    EXPECT_EQ(a.width(), 1u);
    EXPECT_EQ(a.value(2), 7);
    EXPECT_EQ(a.bounds(0), (std::pair<index_type, index_type>{1, 7}));

    // Copies share the integer buffer
    IndexArray b = a;
    EXPECT_EQ(a.storage(), b.storage());

    auto m = IndexArray::of_multi({{2, 5}, {0, 9}}, 2);
    EXPECT_EQ(m.component(1, 0), 0);
    EXPECT_EQ(m.component(1, 1), 9);
    EXPECT_EQ(m.bounds(1), (std::pair<index_type, index_type>{5, 9}));
    EXPECT_EQ(first_value(m), 2);
}

TEST(IndexTest, IndexArrayRejectsInconsistentShapes) {
    EXPECT_THROW(IndexArray({1, 2, 3}, Shape{2, 2}), std::invalid_argument);
    EXPECT_THROW((void)IndexArray::of_multi({1, 2, 3}, 2, Shape{2}), std::invalid_argument);
    EXPECT_THROW((void)IndexArray::of_multi({{1, 2}, {3}}, 2), std::invalid_argument);
}

TEST(IndexTest, ResolveFillsSliceExtents) {
    auto resolved = resolve_indices(Shape{3, 4, 5}, {FullSlice{}, Scalar{1}, FullSlice{}});
    EXPECT_EQ(std::get<FullSlice>(resolved[0]).extent, 3u);
    EXPECT_EQ(std::get<FullSlice>(resolved[2]).extent, 5u);

    // A final slice spans every remaining dimension
    auto folded = resolve_indices(Shape{3, 4, 5}, {Scalar{0}, FullSlice{}});
    EXPECT_EQ(std::get<FullSlice>(folded[1]).extent, 20u);

    // Resolved slices are left alone
    auto kept = resolve_indices(Shape{3, 4}, {FullSlice{2}, FullSlice{}});
    EXPECT_EQ(std::get<FullSlice>(kept[0]).extent, 2u);
}

TEST(IndexTest, UnresolvedSliceHasNoShape) {
    Shape shape;
    EXPECT_THROW(append_shape(FullSlice{}, shape), std::logic_error);
}

TEST(IndexTest, Predicates) {
    std::vector<Index> indices = {Range{0, 1, 2}, Scalar{1}, Scalar{2}};
    EXPECT_TRUE(is_range(indices[0]));
    EXPECT_TRUE(all_scalar(indices, 1));
    EXPECT_FALSE(all_scalar(indices));
    EXPECT_TRUE(all_scalar({}));
    EXPECT_TRUE(is_array(IndexArray({0})));
    EXPECT_TRUE(is_slice(FullSlice{}));
}

TEST(IndexTest, Formatting) {
    std::vector<Index> indices = {FullSlice{}, Scalar{2}, Range{1, 2, 3}, FullSlice{4}};
    EXPECT_EQ(to_string(indices), "(:, 2, 1:2:3, :4)");
    EXPECT_EQ(to_string(IndexArray::of_multi({{0, 0}}, 2)), "IndexArray[1]{width=2}");
    EXPECT_EQ(to_string(Shape{2, 3}), "[2, 3]");
}

TEST(IndexTest, IndexStyleVisibleFromIndexHeader) {
    static_assert(std::is_same_v<IndexStyle, lattice::core::IndexStyle>);
    EXPECT_EQ(lattice::core::combine(IndexStyle::Linear, IndexStyle::Cartesian), IndexStyle::Cartesian);
}
