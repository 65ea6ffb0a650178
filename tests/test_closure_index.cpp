#include <gtest/gtest.h>

#include <algorithm>

#include "closure_index.h"
#include "errors.h"

namespace {

std::vector<std::vector<ItemCode>> items_of(const std::vector<CodedItemset>& sets) {
    std::vector<std::vector<ItemCode>> out;
    for (const auto& s : sets) out.push_back(s.items);
    return out;
}

} // namespace

TEST(ClosureIndex, ClosedRejectsSubsetOfEqualSupport) {
    ClosureIndex index(ClosureMode::Closed);
    EXPECT_TRUE(index.accept({1, 2, 3}, 5));
    EXPECT_FALSE(index.accept({1, 3}, 5));
    EXPECT_TRUE(index.accept({1, 3}, 7));      // higher support: closed
    EXPECT_EQ(index.size(), 2u);
}

TEST(ClosureIndex, ClosedEvictsEarlierSubsets) {
    ClosureIndex index(ClosureMode::Closed);
    EXPECT_TRUE(index.accept({2}, 4));
    EXPECT_TRUE(index.accept({1, 2}, 6));
    EXPECT_TRUE(index.accept({3, 2, 1}, 4));   // items in any order
    auto survivors = index.survivors();
    EXPECT_EQ(items_of(survivors), (std::vector<std::vector<ItemCode>>{{1, 2}, {1, 2, 3}}));
}

TEST(ClosureIndex, ClosedKeepsIncomparableEqualSupport) {
    ClosureIndex index(ClosureMode::Closed);
    EXPECT_TRUE(index.accept({1, 2}, 3));
    EXPECT_TRUE(index.accept({2, 3}, 3));
    EXPECT_EQ(index.size(), 2u);
}

TEST(ClosureIndex, EmptySetIsSubsetOfEverything) {
    ClosureIndex closed(ClosureMode::Closed);
    EXPECT_TRUE(closed.accept({}, 9));
    EXPECT_TRUE(closed.accept({4}, 9));
    EXPECT_EQ(items_of(closed.survivors()), (std::vector<std::vector<ItemCode>>{{4}}));

    ClosureIndex maximal(ClosureMode::Maximal);
    EXPECT_TRUE(maximal.accept({4}, 2));
    EXPECT_FALSE(maximal.accept({}, 9));
}

TEST(ClosureIndex, MaximalIgnoresSupport) {
    ClosureIndex index(ClosureMode::Maximal);
    EXPECT_TRUE(index.accept({1}, 10));
    EXPECT_TRUE(index.accept({2}, 10));
    EXPECT_TRUE(index.accept({1, 2}, 3));
    EXPECT_TRUE(index.accept({3}, 8));
    EXPECT_FALSE(index.accept({2}, 10));
    EXPECT_FALSE(index.accept({}, 20));

    auto survivors = index.survivors();
    EXPECT_EQ(items_of(survivors), (std::vector<std::vector<ItemCode>>{{1, 2}, {3}}));
    EXPECT_EQ(survivors[0].support, 3);
}

TEST(ClosureIndex, MaximalSignatureCollisions) {
    // 1 and 65 share a signature bit
    ClosureIndex index(ClosureMode::Maximal);
    EXPECT_TRUE(index.accept({1, 2}, 1));
    EXPECT_TRUE(index.accept({65}, 1));
    EXPECT_TRUE(index.accept({2, 65}, 1));
    EXPECT_EQ(items_of(index.survivors()), (std::vector<std::vector<ItemCode>>{{1, 2}, {2, 65}}));
}

TEST(ClosureIndex, MaximalManyEvictions) {
    ClosureIndex index(ClosureMode::Maximal);
    for (ItemCode i = 0; i < 3000; ++i) EXPECT_TRUE(index.accept({i}, 1));
    std::vector<ItemCode> all(3000);
    for (ItemCode i = 0; i < 3000; ++i) all[i] = i;
    EXPECT_TRUE(index.accept(all, 1));
    EXPECT_EQ(index.size(), 1u);
    EXPECT_FALSE(index.accept({17, 2999}, 1));
}

TEST(ClosureIndex, GeneratorsNeedAllImmediateSubsets) {
    ClosureIndex index(ClosureMode::Generators);
    index.accept({}, 10);
    index.accept({1}, 6);
    index.accept({2}, 6);
    index.accept({1, 2}, 6);
    index.accept({3}, 10);

    // {1,2} has the support of {1}; {3} has the support of the empty set
    EXPECT_EQ(items_of(index.survivors()), (std::vector<std::vector<ItemCode>>{{}, {1}, {2}}));
}

TEST(ClosureIndex, GeneratorsMissingSubsetThrows) {
    ClosureIndex index(ClosureMode::Generators);
    index.accept({}, 10);
    index.accept({1}, 6);
    index.accept({1, 2}, 4);
    EXPECT_THROW(index.survivors(), MissingSupportDataError);
}

TEST(ClosureIndex, EqualSupportUpToSummationOrder) {
    const double summed = 0.1 + 0.2;   // 0.30000000000000004
    ASSERT_NE(summed, 0.3);

    ClosureIndex closed(ClosureMode::Closed);
    EXPECT_TRUE(closed.accept({1, 2}, summed));
    EXPECT_FALSE(closed.accept({1}, 0.3));
    EXPECT_TRUE(closed.accept({2}, 0.4));
    EXPECT_EQ(closed.size(), 2u);

    ClosureIndex gens(ClosureMode::Generators);
    gens.accept({}, 1.0);
    gens.accept({1}, 0.3);
    gens.accept({2}, 0.4);
    gens.accept({1, 2}, summed);
    EXPECT_EQ(items_of(gens.survivors()), (std::vector<std::vector<ItemCode>>{{}, {1}, {2}}));
}
