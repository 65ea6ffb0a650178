#ifndef RULE_GENERATOR_H
#define RULE_GENERATOR_H

#include <functional>
#include <limits>
#include <string>
#include <unordered_map>
#include <vector>
#include "types.h"
#include "cancel_token.h"
#include "item_encoder.h"
#include "transaction_database.h"

// Raw counts handed to an external evaluation measure, in weight units
struct ContingencyCounts {
    double antecedent;   // support of the rule body
    double consequent;   // support of the rule head
    double itemset;      // support of body and head together
    double total;        // total transaction weight
};

// Computes secondary statistics (significance tests etc.) for a rule
using RuleEvaluator = std::function<std::vector<double>(const ContingencyCounts&)>;

// Where an item may occur in a rule
enum class Appearance {
    None,   // in no rule at all
    Body,
    Head,
    Both,
};

// Accepts "-", "a", "c", "x" and the long forms of the original tools
// ("none", "in", "ante", "body", "out", "cons", "head", "both", "inout" ...).
// Throws InvalidConfigError on anything else.
Appearance parse_appearance(const std::string& code);

struct RuleOptions {
    double min_confidence = 80.0;   // percent
    Support min_support = 0;        // rule support
    Support max_support = std::numeric_limits<Support>::max();
    size_t min_items = 2;           // body and head together
    double min_lift = 0.0;
    bool single_consequent = false;
    // Rule support is the body support unless set, then body and head
    // together; the support thresholds apply to whichever is used.
    bool original_support = false;
    std::unordered_map<Item, Appearance> appearances;
    Appearance default_appearance = Appearance::Both;
    const CancelToken* cancel = nullptr;
};

// Derives association rules from a complete collection of frequent itemsets
class RuleGenerator {
private:
    RuleOptions options;
    RuleEvaluator evaluator;

public:
    explicit RuleGenerator(RuleOptions options, RuleEvaluator evaluator = nullptr);

    // For every itemset of size >= 2, in input order, tries each non-empty
    // proper subset as antecedent (ascending size, lexicographic within a
    // size) with the remaining items as consequent. Every antecedent and
    // consequent must itself be among `itemsets`, otherwise
    // MissingSupportDataError is thrown. Items are placed only where their
    // appearance allows.
    std::vector<Rule> generate(const std::vector<CodedItemset>& itemsets,
                               const TransactionDatabase& db,
                               const ItemEncoder& encoder) const;
};

#endif // RULE_GENERATOR_H
