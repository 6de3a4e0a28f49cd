#include "lattice/common/errors.hpp"
#include "lattice/compute/reindex.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace lattice::compute;
using lattice::core::ReindexArityError;

TEST(ReindexTest, ScalarsAreKept) {
    auto combined = reindex({Scalar{2}, FullSlice{4}}, {Range{1, 1, 2}});
    EXPECT_EQ(to_string(combined), "(2, 1:1:2)");
}

TEST(ReindexTest, SlicesPassInnerIndicesThrough) {
    auto combined = reindex({FullSlice{3}, FullSlice{4}}, {Scalar{1}, IndexArray({0, 3})});
    ASSERT_EQ(combined.size(), 2u);
    EXPECT_EQ(std::get<Scalar>(combined[0]).value, 1);
    EXPECT_EQ(std::get<IndexArray>(combined[1]).values(), (std::vector<index_type>{0, 3}));
}

TEST(ReindexTest, RangesCompose) {
    const Range outer{1, 2, 4}; // 1, 3, 5, 7

    EXPECT_EQ(to_string(reindex({outer}, {Scalar{3}})), "(7)");
    EXPECT_EQ(to_string(reindex({outer}, {FullSlice{4}})), "(1:2:4)");
    EXPECT_EQ(to_string(reindex({outer}, {Range{1, 1, 2}})), "(3:2:2)");
    EXPECT_EQ(to_string(reindex({outer}, {Range{3, -2, 2}})), "(7:-4:2)");

    auto gathered = reindex({outer}, {IndexArray({0, 3, 3})});
    EXPECT_EQ(std::get<IndexArray>(gathered[0]).values(), (std::vector<index_type>{1, 7, 7}));
}

TEST(ReindexTest, IndexArraysGather) {
    const IndexArray outer({5, 6, 7, 8});

    EXPECT_EQ(to_string(reindex({outer}, {Scalar{2}})), "(7)");

    auto sub = reindex({outer}, {Range{1, 2, 2}});
    EXPECT_EQ(std::get<IndexArray>(sub[0]).values(), (std::vector<index_type>{6, 8}));
    EXPECT_EQ(std::get<IndexArray>(sub[0]).shape(), (Shape{2}));
}

TEST(ReindexTest, MatrixIndexArrayConsumesTwoInnerIndices) {
    // Column-major 2x2: (0,0)=10, (1,0)=11, (0,1)=12, (1,1)=13
    const IndexArray outer({10, 11, 12, 13}, Shape{2, 2});

    auto row = reindex({outer, Scalar{0}}, {Scalar{1}, FullSlice{2}});
    ASSERT_EQ(row.size(), 2u);
    EXPECT_EQ(std::get<IndexArray>(row[0]).values(), (std::vector<index_type>{11, 13}));
    EXPECT_EQ(std::get<Scalar>(row[1]).value, 0);

    auto both = reindex({outer}, {FullSlice{2}, Range{1, 1, 1}});
    EXPECT_EQ(std::get<IndexArray>(both[0]).values(), (std::vector<index_type>{12, 13}));
    EXPECT_EQ(std::get<IndexArray>(both[0]).shape(), (Shape{2, 1}));
}

TEST(ReindexTest, MultiIndexElementsExpandToScalars) {
    const auto pairs = IndexArray::of_multi({{0, 1}, {2, 3}, {4, 5}}, 2);

    auto element = reindex({pairs, Scalar{7}}, {Scalar{1}});
    EXPECT_EQ(to_string(element), "(2, 3, 7)");

    auto subset = reindex({pairs}, {Range{1, 1, 2}});
    const auto& array = std::get<IndexArray>(subset[0]);
    EXPECT_EQ(array.width(), 2u);
    EXPECT_EQ(array.values(), (std::vector<index_type>{2, 3, 4, 5}));
}

TEST(ReindexTest, ArityMismatchThrows) {
    EXPECT_THROW((void)reindex({FullSlice{3}}, {}), ReindexArityError);
    EXPECT_THROW((void)reindex({FullSlice{3}}, {Scalar{0}, Scalar{0}}), ReindexArityError);
    EXPECT_THROW((void)reindex({IndexArray({1, 2, 3, 4}, Shape{2, 2})}, {Scalar{0}}),
                 ReindexArityError);
}

TEST(ReindexTest, ScalarForm) {
    const std::vector<Index> outer = {Scalar{3}, Range{1, 2, 4}, IndexArray({9, 8, 7})};
    const index_type         sub[] = {2, 1};
    MultiIndex               out;
    reindex_scalar(outer, sub, 2, out);
    EXPECT_EQ(out, (MultiIndex{3, 5, 8}));

    const auto               pairs  = IndexArray::of_multi({{0, 1}, {2, 3}}, 2);
    const std::vector<Index> multi  = {FullSlice{4}, pairs};
    const index_type         sub2[] = {3, 1};
    reindex_scalar(multi, sub2, 2, out);
    EXPECT_EQ(out, (MultiIndex{3, 2, 3}));

    EXPECT_THROW(reindex_scalar(outer, sub, 1, out), ReindexArityError);
}

TEST(ReindexTest, MultiIndexArraysNeedTwoLayers) {
    EXPECT_FALSE(needs_two_layers({Scalar{0}, FullSlice{2}, IndexArray({1})}));
    EXPECT_TRUE(needs_two_layers({IndexArray::of_multi({{0, 1}}, 2)}));
}
