#include <gtest/gtest.h>

#include "errors.h"
#include "item_encoder.h"
#include "pattern_reporter.h"

namespace {

class PatternReporterTest : public ::testing::Test {
protected:
    ItemEncoder encoder;
    TransactionDatabase db;
    std::vector<Pattern> got;

    void SetUp() override {
        db = encoder.encode({{{"a", "b", "c"}, 1.0}, {{"a", "b"}, 1.0}, {{"a"}, 2.0}});
    }

    PatternReporter make(ReportOptions options) {
        return PatternReporter(encoder, db.total_weight(), options, [this](Pattern&& p) {
            got.push_back(std::move(p));
            return true;
        });
    }
};

} // namespace

TEST_F(PatternReporterTest, DecodesAndKeepsArrivalOrder) {
    PatternReporter r = make(ReportOptions());
    EXPECT_TRUE(r.report({encoder.code_of("b"), encoder.code_of("a")}, 2.0));
    EXPECT_TRUE(r.report({encoder.code_of("c")}, 1.0));

    ASSERT_EQ(got.size(), 2u);
    EXPECT_EQ(got[0].items, (std::vector<Item>{"b", "a"}));
    EXPECT_DOUBLE_EQ(got[0].support, 2.0);
    EXPECT_EQ(got[1].items, (std::vector<Item>{"c"}));
    EXPECT_TRUE(got[0].extra.empty());
}

TEST_F(PatternReporterTest, SizeAndSupportFilters) {
    ReportOptions options;
    options.zmin = 2;
    options.zmax = 2;
    options.max_support = 2.0;
    PatternReporter r = make(options);

    EXPECT_TRUE(r.report({0}, 1.0));            // too small
    EXPECT_TRUE(r.report({0, 1, 2}, 1.0));      // too large
    EXPECT_TRUE(r.report({0, 1}, 3.0));     // too frequent
    EXPECT_TRUE(r.report({0, 2}, 2.0));
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(r.reported(), 1u);
}

TEST_F(PatternReporterTest, ResultLimitStopsTheSearch) {
    ReportOptions options;
    options.max_results = 2;
    PatternReporter r = make(options);
    EXPECT_TRUE(r.report({0}, 1.0));
    EXPECT_FALSE(r.report({1}, 1.0));
    EXPECT_TRUE(r.full());
    EXPECT_FALSE(r.report({2}, 1.0));
    EXPECT_EQ(got.size(), 2u);
}

TEST_F(PatternReporterTest, ConsumerStop) {
    PatternReporter r(encoder, db.total_weight(), ReportOptions(), [](Pattern&&) { return false; });
    EXPECT_FALSE(r.report({0}, 1.0));
    EXPECT_TRUE(r.full());
}

TEST_F(PatternReporterTest, ExtraValues) {
    ReportOptions options;
    options.values = "QsaS";
    PatternReporter r = make(options);
    r.report({0}, 2.0);
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].extra, (std::vector<double>{4.0, 0.5, 2.0, 50.0}));
}

TEST(PatternReporterValues, RejectsUnknownCodes) {
    EXPECT_NO_THROW(PatternReporter::validate_values("asSQ"));
    EXPECT_THROW(PatternReporter::validate_values("e"), InvalidConfigError);
}
