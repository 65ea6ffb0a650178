#include <gtest/gtest.h>

#include <sstream>

#include "errors.h"
#include "result_writer.h"
#include "transaction_reader.h"

TEST(TransactionReader, BlankSeparatedLines) {
    std::istringstream in("a b  c\n\n\td\te\r\nf");
    auto rows = parse_transactions(in, ReaderOptions());
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].items, (std::vector<Item>{"a", "b", "c"}));
    EXPECT_EQ(rows[1].items, (std::vector<Item>{"d", "e"}));
    EXPECT_EQ(rows[2].items, (std::vector<Item>{"f"}));
    EXPECT_DOUBLE_EQ(rows[0].weight, 1.0);
}

TEST(TransactionReader, QuotedFieldsAndDelimiter) {
    ReaderOptions options;
    options.delimiter = ',';
    std::istringstream in("\"milk, whole\",bread\n\"say \"\"hi\"\"\",,eggs\n");
    auto rows = parse_transactions(in, options);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].items, (std::vector<Item>{"milk, whole", "bread"}));
    EXPECT_EQ(rows[1].items, (std::vector<Item>{"say \"hi\"", "eggs"}));
}

TEST(TransactionReader, TrailingWeight) {
    ReaderOptions options;
    options.weighted = true;
    std::istringstream in("1 2 3 0.5\n4 5 1.2\n");
    auto rows = parse_transactions(in, options);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].items, (std::vector<Item>{"1", "2", "3"}));
    EXPECT_DOUBLE_EQ(rows[0].weight, 0.5);
    EXPECT_DOUBLE_EQ(rows[1].weight, 1.2);
}

TEST(TransactionReader, BadWeightReportsLine) {
    ReaderOptions options;
    options.weighted = true;
    std::istringstream in("a 1\nb x\n");
    try {
        parse_transactions(in, options);
        FAIL() << "expected InvalidInputError";
    } catch (const InvalidInputError& e) {
        EXPECT_NE(std::string(e.what()).find("Line 2"), std::string::npos);
    }
}

TEST(TransactionReader, MissingFileThrows) {
    EXPECT_THROW(read_transactions("/nonexistent/transactions.txt", ReaderOptions()), InvalidInputError);
}

TEST(ResultWriter, PatternsAndRulesCsv) {
    std::ostringstream patterns;
    write_patterns(patterns, {{{"a", "b\"c"}, 2.5, {50.0}}}, "S");
    EXPECT_EQ(patterns.str(), "itemset,support,length,pct_support\n\"a b\"\"c\",2.5,2,50\n");

    std::ostringstream rules;
    Rule r;
    r.antecedent = {"x"};
    r.consequent = {"y", "z"};
    r.support = 1.5;
    r.confidence = 0.75;
    r.lift = 2;
    write_rules(rules, {r});
    EXPECT_EQ(rules.str(), "antecedent,consequent,support,confidence,lift\n\"x\",\"y z\",1.5,0.75,2\n");
}

TEST(ResultWriter, WritesFullPrecision) {
    std::ostringstream out;
    out.precision(3);
    write_patterns(out, {{{"a"}, 1234567.5, {}}, {{"b"}, 1.0 / 3.0, {}}}, "");
    std::string text = out.str();
    EXPECT_NE(text.find("\"a\",1234567.5,1\n"), std::string::npos) << text;

    size_t start = text.find("\"b\",") + 4;
    double back = std::stod(text.substr(start, text.find(',', start) - start));
    EXPECT_EQ(back, 1.0 / 3.0);
    // The caller's stream settings survive
    EXPECT_EQ(out.precision(), 3);
}
