#ifndef ITEMSET_MINER_H
#define ITEMSET_MINER_H

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "types.h"
#include "algorithm_factory.h"
#include "cancel_token.h"
#include "closure_index.h"
#include "item_encoder.h"
#include "pattern_reporter.h"
#include "rule_generator.h"
#include "transaction_database.h"

enum class Target {
    Frequent,
    Closed,
    Maximal,
    Generators,
    Rules,
};

// Also accepts the one-letter and short forms (s, c, m, g, r, sets, gens ...)
Target parse_target(const std::string& name);

// Thresholds follow the sign convention: negative = absolute weighted
// count, non-negative = percent of the total transaction weight.
struct MinerConfig {
    double min_support = 10.0;
    double max_support = 100.0;
    int zmin = 1;
    int zmax = -1;                 // -1 = unbounded
    double min_confidence = 80.0;  // percent, rules only
    double min_lift = 0.0;         // rules only
    bool single_consequent = false;
    bool original_support = false; // rule support = body & head, not body
    std::unordered_map<Item, Appearance> appearances;   // rules only
    Appearance default_appearance = Appearance::Both;
    std::string target = "frequent";
    std::string algorithm = "fpgrowth";
    std::string report;            // extra values, see PatternReporter
    size_t max_results = 0;        // 0 = unlimited
    int threads = 0;               // 0 = OpenMP default
    bool verbose = false;
};

// Everything one mining call owns; dropped when the call returns
struct MiningContext {
    ItemEncoder encoder;
    TransactionDatabase db;
    std::unique_ptr<ClosureIndex> index;
};

class ItemsetMiner {
private:
    MinerConfig config;
    Target target_kind;
    AlgorithmKind algorithm_kind;
    const CancelToken* cancel = nullptr;
    RuleEvaluator evaluator;

    MiningParams make_params(const MiningContext& ctx) const;
    void run_search(MiningContext& ctx, const MiningParams& params, const PatternSink& sink) const;

public:
    // Validates the whole configuration; throws InvalidConfigError
    explicit ItemsetMiner(MinerConfig config);

    Target target() const { return target_kind; }

    // Polled during the search; a request makes the call throw AbortedError
    void set_cancel_token(const CancelToken* token) { cancel = token; }

    // Extra rule measures, computed from raw counts
    void set_rule_evaluator(RuleEvaluator fn) { evaluator = std::move(fn); }

    // Itemsets of the configured target (frequent/closed/maximal/generators)
    std::vector<Pattern> mine(const std::vector<RawTransaction>& input) const;

    // Same as mine() but hands patterns over as they pass the filters;
    // `consumer` returning false ends the search. Returns the number reported.
    size_t search(const std::vector<RawTransaction>& input, const PatternCallback& consumer) const;

    // Association rules from the frequent itemsets, whatever the target
    std::vector<Rule> mine_rules(const std::vector<RawTransaction>& input) const;
};

#endif // ITEMSET_MINER_H
