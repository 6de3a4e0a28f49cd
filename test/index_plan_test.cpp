#include "lattice/compute/index_plan.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace lattice::compute;

namespace {

IndexPlan plan_for(const std::vector<Index>& indices, IndexStyle parent = IndexStyle::Linear) {
    return classify(indices, parent);
}

} // namespace

TEST(IndexPlanTest, NoIndicesIsLinear) {
    const IndexPlan plan = plan_for({});
    EXPECT_EQ(plan.style, IndexStyle::Linear);
    EXPECT_TRUE(plan.fast);
    EXPECT_TRUE(plan.contiguous);
}

TEST(IndexPlanTest, AllScalarsIsContiguous) {
    const IndexPlan plan = plan_for({Scalar{1}, Scalar{2}});
    EXPECT_TRUE(plan.fast);
    EXPECT_TRUE(plan.contiguous);
}

TEST(IndexPlanTest, LeadingSlicesAreContiguous) {
    EXPECT_TRUE(plan_for({FullSlice{2}, FullSlice{3}, FullSlice{4}}).contiguous);
    EXPECT_TRUE(plan_for({FullSlice{2}, FullSlice{3}, Scalar{1}}).contiguous);
    EXPECT_TRUE(plan_for({FullSlice{2}, Range{1, 1, 2}, Scalar{0}}).contiguous);
    EXPECT_TRUE(plan_for({FullSlice{2}, FullSlice{3}, Range{1, 1, 2}}).contiguous);
    EXPECT_TRUE(plan_for({Range{1, 1, 2}, Scalar{0}}).contiguous);
}

TEST(IndexPlanTest, ColumnOfMatrixIsFast) {
    const IndexPlan plan = plan_for({FullSlice{2}, Scalar{0}});
    EXPECT_EQ(plan.style, IndexStyle::Linear);
    EXPECT_TRUE(plan.fast);
    EXPECT_TRUE(plan.contiguous);
}

TEST(IndexPlanTest, SingleStridedRangeIsFastButNotContiguous) {
    const IndexPlan row = plan_for({Scalar{1}, FullSlice{4}});
    EXPECT_TRUE(row.fast);
    EXPECT_FALSE(row.contiguous);

    const IndexPlan stepped = plan_for({Scalar{0}, Range{0, 2, 3}, Scalar{1}});
    EXPECT_TRUE(stepped.fast);
    EXPECT_FALSE(stepped.contiguous);

    const IndexPlan leading = plan_for({Range{0, 3, 2}, Scalar{1}});
    EXPECT_TRUE(leading.fast);
    EXPECT_FALSE(leading.contiguous);
}

TEST(IndexPlanTest, StepRangeAfterSlicesIsCartesian) {
    EXPECT_EQ(plan_for({FullSlice{4}, Range{0, 2, 2}}).style, IndexStyle::Cartesian);
}

TEST(IndexPlanTest, TwoRangesAreCartesian) {
    EXPECT_EQ(plan_for({Range{0, 1, 2}, Range{0, 1, 2}}).style, IndexStyle::Cartesian);
    EXPECT_EQ(plan_for({Range{1, 1, 2}, FullSlice{3}}).style, IndexStyle::Cartesian);
    EXPECT_EQ(plan_for({FullSlice{2}, Range{0, 1, 2}, FullSlice{3}}).style, IndexStyle::Cartesian);
}

TEST(IndexPlanTest, IndexArraysAreCartesian) {
    const IndexPlan plan = plan_for({IndexArray({0, 2}), Scalar{0}});
    EXPECT_EQ(plan.style, IndexStyle::Cartesian);
    EXPECT_FALSE(plan.fast);
    EXPECT_FALSE(plan.contiguous);
    EXPECT_EQ(plan_for({FullSlice{2}, IndexArray({1})}).style, IndexStyle::Cartesian);
}

TEST(IndexPlanTest, CartesianParentForcesCartesian) {
    EXPECT_EQ(view_indexing({FullSlice{2}, Scalar{0}}), IndexStyle::Linear);
    const IndexPlan plan = plan_for({FullSlice{2}, Scalar{0}}, IndexStyle::Cartesian);
    EXPECT_EQ(plan.style, IndexStyle::Cartesian);
    EXPECT_FALSE(plan.fast);
    EXPECT_FALSE(plan.contiguous);
}

TEST(IndexPlanTest, Formatting) {
    EXPECT_EQ(std::string(to_string(plan_for({FullSlice{2}}))), "linear-contiguous");
    EXPECT_EQ(std::string(to_string(plan_for({Scalar{0}, FullSlice{2}}))), "linear-strided");
    EXPECT_EQ(std::string(to_string(plan_for({IndexArray({0})}))), "cartesian");
}
