#include <gtest/gtest.h>

#include "algorithm_factory.h"
#include "errors.h"
#include "item_encoder.h"
#include "itemset_miner.h"
#include "pattern_emitter.h"
#include "test_helpers.h"

using namespace test_data;

namespace {

const std::vector<std::string> kAlgorithms = {"apriori", "eclat", "fpgrowth", "proj", "sam", "ista"};

MinerConfig config_for(const std::string& algo, double supp, int zmin = 1, int zmax = -1) {
    MinerConfig cfg;
    cfg.algorithm = algo;
    cfg.min_support = supp;
    cfg.zmin = zmin;
    cfg.zmax = zmax;
    return cfg;
}

// Runs a strategy directly, collecting what reaches the sink
SupportTable run_direct(const std::string& algo, const std::vector<RawTransaction>& raw,
                        Support min_support, size_t zmin) {
    ItemEncoder encoder;
    TransactionDatabase db = encoder.encode(raw);
    MiningParams params;
    params.min_support = min_support;
    params.zmin = zmin;

    SupportTable table;
    PatternSink sink = [&](const std::vector<ItemCode>& items, Support support) {
        std::vector<std::string> key = encoder.decode(items);
        std::sort(key.begin(), key.end());
        EXPECT_TRUE(table.emplace(key, units(support)).second) << "itemset reported twice";
        return true;
    };
    PatternEmitter emitter(sink, params);
    auto algo_ptr = make_algorithm(parse_algorithm_kind(algo));
    algo_ptr->mine(db, params, emitter);
    return table;
}

class StrategyTest : public ::testing::TestWithParam<std::string> {};

} // namespace

TEST_P(StrategyTest, MatchesBruteForceOnWeightedScenario) {
    auto db = weighted_scenario();
    SupportTable expected = sized(brute_force(db, absolute(1.6)), 1, 100);
    EXPECT_EQ(run_direct(GetParam(), db, absolute(1.6), 1), expected);
}

TEST_P(StrategyTest, MatchesBruteForceOnGeneratedData) {
    auto db = generated(60, 8, 7);
    for (double supp : {0.5, 3.0, 10.0, 25.0}) {
        SupportTable expected = brute_force(db, absolute(supp));
        EXPECT_EQ(run_direct(GetParam(), db, absolute(supp), 0), expected) << "supp " << supp;
    }
}

TEST_P(StrategyTest, EmptyItemsetOnlyWhenRequested) {
    auto db = weighted_scenario();
    ItemsetMiner with_empty(config_for(GetParam(), -1.6, 0));
    ItemsetMiner without(config_for(GetParam(), -1.6, 1));

    SupportTable a = to_table(with_empty.mine(db));
    SupportTable b = to_table(without.mine(db));
    ASSERT_EQ(a.count({}), 1u);
    EXPECT_EQ(a.at({}), units(7.5));
    EXPECT_EQ(b.count({}), 0u);
    EXPECT_EQ(a.size(), b.size() + 1);
}

TEST_P(StrategyTest, ThresholdAboveTotalYieldsNothing) {
    ItemsetMiner miner(config_for(GetParam(), -100.0, 0));
    EXPECT_TRUE(miner.mine(weighted_scenario()).empty());
}

TEST_P(StrategyTest, RespectsSizeRange) {
    auto db = generated(50, 7, 11);
    ItemsetMiner miner(config_for(GetParam(), -2.0, 2, 3));
    SupportTable expected = sized(brute_force(db, absolute(2.0)), 2, 3);
    EXPECT_EQ(to_table(miner.mine(db)), expected);
}

TEST_P(StrategyTest, ZmaxBelowSmallestFrequentSizeIsEmpty) {
    ItemsetMiner miner(config_for(GetParam(), -1.6, 0, 0));
    auto result = miner.mine(weighted_scenario());
    // Only the empty itemset has size 0
    ASSERT_EQ(result.size(), 1u);
    EXPECT_TRUE(result[0].items.empty());
}

TEST_P(StrategyTest, ConsumerCanStopEarly) {
    ItemsetMiner miner(config_for(GetParam(), -0.1));
    size_t seen = 0;
    size_t reported = miner.search(generated(40, 6, 3), [&](Pattern&&) { return ++seen < 3; });
    EXPECT_EQ(seen, 3u);
    EXPECT_EQ(reported, 3u);
}

TEST_P(StrategyTest, CancellationThrowsAborted) {
    ItemsetMiner miner(config_for(GetParam(), -0.1));
    CancelToken token;
    token.request();
    miner.set_cancel_token(&token);
    EXPECT_THROW(miner.mine(generated(40, 6, 3)), AbortedError);
}

TEST_P(StrategyTest, CancellationDuringSearch) {
    ItemsetMiner miner(config_for(GetParam(), -0.1));
    CancelToken token;
    miner.set_cancel_token(&token);
    size_t seen = 0;
    EXPECT_THROW(miner.search(generated(40, 6, 3), [&](Pattern&&) {
                     if (++seen == 2) token.request();
                     return true;
                 }),
                 AbortedError);
}

TEST_P(StrategyTest, RepeatedRunsAreIdentical) {
    auto db = generated(45, 7, 5);
    ItemsetMiner miner(config_for(GetParam(), 5.0));
    auto first = miner.mine(db);
    auto second = miner.mine(db);
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].items, second[i].items);
        EXPECT_DOUBLE_EQ(first[i].support, second[i].support);
    }
}

INSTANTIATE_TEST_SUITE_P(AllStrategies, StrategyTest, ::testing::ValuesIn(kAlgorithms));

TEST(StrategyCrossCheck, AllStrategiesAgree) {
    auto db = generated(80, 8, 42);
    for (double supp : {2.0, 10.0, 30.0}) {
        SupportTable reference;
        for (const auto& algo : kAlgorithms) {
            ItemsetMiner miner(config_for(algo, supp));
            size_t dups = 0;
            SupportTable got = to_table(miner.mine(db), &dups);
            EXPECT_EQ(dups, 0u) << algo;
            if (algo == kAlgorithms.front()) reference = got;
            else EXPECT_EQ(got, reference) << algo << " at " << supp << "%";
        }
    }
}

TEST(AlgorithmFactory, ParsesNamesAndAliases) {
    EXPECT_EQ(parse_algorithm_kind("apriori"), AlgorithmKind::Apriori);
    EXPECT_EQ(parse_algorithm_kind("fpg"), AlgorithmKind::FPGrowth);
    EXPECT_EQ(parse_algorithm_kind("default"), AlgorithmKind::FPGrowth);
    EXPECT_EQ(parse_algorithm_kind("projection"), AlgorithmKind::Projection);
    EXPECT_EQ(make_algorithm(AlgorithmKind::Ista)->name(), "ista");
    EXPECT_EQ(make_algorithm(AlgorithmKind::Projection)->name(), "proj");
    EXPECT_THROW(parse_algorithm_kind("relim"), InvalidConfigError);
}
