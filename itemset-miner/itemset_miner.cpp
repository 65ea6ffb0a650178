#include "itemset_miner.h"
#include "errors.h"
#include "pattern_emitter.h"
#include "support.h"
#include "timer.h"
#include <algorithm>
#include <cfloat>
#include <cmath>
#include <limits>
#include <iostream>

Target parse_target(const std::string& name) {
    if (name == "s" || name == "sets" || name == "all" || name == "frequent")
        return Target::Frequent;
    if (name == "c" || name == "closed")
        return Target::Closed;
    if (name == "m" || name == "maximal")
        return Target::Maximal;
    if (name == "g" || name == "gens" || name == "generators")
        return Target::Generators;
    if (name == "r" || name == "rules")
        return Target::Rules;

    throw InvalidConfigError("Unknown target: " + name);
}

ItemsetMiner::ItemsetMiner(MinerConfig cfg) : config(std::move(cfg)) {
    if (!std::isfinite(config.min_support))
        throw InvalidConfigError("Minimum support must be finite");
    if (!std::isfinite(config.max_support))
        throw InvalidConfigError("Maximum support must be finite");
    if (config.zmin < 0)
        throw InvalidConfigError("zmin must be non-negative, got " + std::to_string(config.zmin));
    if (config.zmax < -1)
        throw InvalidConfigError("zmax must be -1 (unbounded) or non-negative, got " +
                                 std::to_string(config.zmax));
    if (config.zmax != -1 && config.zmax < config.zmin)
        throw InvalidConfigError("zmax (" + std::to_string(config.zmax) + ") is smaller than zmin (" +
                                 std::to_string(config.zmin) + ")");
    if (!(config.min_confidence >= 0.0 && config.min_confidence <= 100.0))
        throw InvalidConfigError("Minimum confidence must lie in [0, 100]");
    if (!(config.min_lift >= 0.0) || !std::isfinite(config.min_lift))
        throw InvalidConfigError("Minimum lift must be a non-negative number");
    if (config.threads < 0)
        throw InvalidConfigError("Thread count must be non-negative");

    target_kind = parse_target(config.target);
    algorithm_kind = parse_algorithm_kind(config.algorithm);
    PatternReporter::validate_values(config.report);
}

MiningParams ItemsetMiner::make_params(const MiningContext& ctx) const {
    MiningParams params;
    params.min_support = resolve_threshold(config.min_support, ctx.db.total_weight());
    params.zmin = (size_t)config.zmin;
    if (config.zmax >= 0) params.zmax = (size_t)config.zmax;
    params.cancel = cancel;
    params.threads = config.threads;
    params.verbose = config.verbose;
    return params;
}

void ItemsetMiner::run_search(MiningContext& ctx, const MiningParams& params,
                              const PatternSink& sink) const {
    auto algo = make_algorithm(algorithm_kind);
    if (config.verbose)
        std::cout << "[LOG] Searching with algorithm=" << algo->name()
                  << ", min_support=" << params.min_support
                  << " of " << ctx.db.total_weight() << std::endl;

    PatternEmitter emitter(sink, params);
    algo->mine(ctx.db, params, emitter);

    if (config.verbose)
        std::cout << "[LOG] " << emitter.emitted() << " itemsets passed to the filters" << std::endl;
}

size_t ItemsetMiner::search(const std::vector<RawTransaction>& input,
                            const PatternCallback& consumer) const {
    if (target_kind == Target::Rules)
        throw InvalidConfigError("Target 'rules' yields rules, not itemsets; call mine_rules()");

    auto total_start = start_timer();
    MiningContext ctx;
    ctx.db = ctx.encoder.encode(input);
    if (config.verbose)
        std::cout << "[LOG] Encoded " << ctx.db.size() << " transactions over "
                  << ctx.db.item_count() << " items" << std::endl;

    MiningParams params = make_params(ctx);
    ReportOptions ropts;
    ropts.zmin = params.zmin;
    ropts.zmax = params.zmax;
    ropts.max_support = resolve_upper_limit(config.max_support, ctx.db.total_weight());
    ropts.max_results = config.max_results;
    ropts.values = config.report;
    PatternReporter reporter(ctx.encoder, ctx.db.total_weight(), ropts, consumer);

    if (target_kind == Target::Frequent) {
        PatternSink sink = [&](const std::vector<ItemCode>& items, Support support) {
            return reporter.report(items, support);
        };
        run_search(ctx, params, sink);
    } else {
        ClosureMode mode = target_kind == Target::Closed  ? ClosureMode::Closed
                         : target_kind == Target::Maximal ? ClosureMode::Maximal
                                                          : ClosureMode::Generators;
        ctx.index = std::make_unique<ClosureIndex>(mode);

        // Closedness and maximality are judged against all frequent
        // itemsets, generators need their immediate subsets down to the
        // empty set; the size range is applied when reporting.
        MiningParams wide = params;
        if (mode == ClosureMode::Generators) wide.zmin = 0;
        else {
            wide.zmin = std::min<size_t>(params.zmin, 1);
            wide.zmax = MiningParams().zmax;
        }

        PatternSink sink = [&](const std::vector<ItemCode>& items, Support support) {
            ctx.index->accept(items, support);
            return true;
        };
        run_search(ctx, wide, sink);

        for (const auto& s : ctx.index->survivors()) {
            if (cancel && cancel->requested())
                throw AbortedError("Search aborted by cancellation request");
            if (!reporter.report(s.items, s.support)) break;
        }
    }

    stop_timer("Itemset Mining", total_start, config.verbose);
    return reporter.reported();
}

std::vector<Pattern> ItemsetMiner::mine(const std::vector<RawTransaction>& input) const {
    std::vector<Pattern> results;
    search(input, [&](Pattern&& p) {
        results.push_back(std::move(p));
        return true;
    });
    return results;
}

std::vector<Rule> ItemsetMiner::mine_rules(const std::vector<RawTransaction>& input) const {
    auto total_start = start_timer();
    MiningContext ctx;
    ctx.db = ctx.encoder.encode(input);

    // Antecedents and consequents need their own supports: collect every
    // frequent itemset from size 1 up. With body support as rule support a
    // rule only needs its itemset to reach min_support * min_confidence.
    MiningParams params = make_params(ctx);
    const Support body_min = params.min_support;
    params.zmin = 1;
    if (!config.original_support)
        params.min_support = std::max(body_min * (config.min_confidence / 100.0) * (1 - DBL_EPSILON),
                                      std::numeric_limits<Support>::denorm_min());
    std::vector<CodedItemset> itemsets;
    PatternSink sink = [&](const std::vector<ItemCode>& items, Support support) {
        itemsets.push_back({items, support});
        return true;
    };
    run_search(ctx, params, sink);

    RuleOptions ropts;
    ropts.min_confidence = config.min_confidence;
    ropts.min_support = body_min;
    ropts.max_support = resolve_upper_limit(config.max_support, ctx.db.total_weight());
    ropts.min_items = (size_t)config.zmin;
    ropts.min_lift = config.min_lift;
    ropts.single_consequent = config.single_consequent;
    ropts.original_support = config.original_support;
    ropts.appearances = config.appearances;
    ropts.default_appearance = config.default_appearance;
    ropts.cancel = cancel;
    RuleGenerator generator(std::move(ropts), evaluator);
    std::vector<Rule> rules = generator.generate(itemsets, ctx.db, ctx.encoder);

    if (config.max_results != 0 && rules.size() > config.max_results)
        rules.resize(config.max_results);

    if (config.verbose)
        std::cout << "[LOG] " << rules.size() << " rules from " << itemsets.size()
                  << " frequent itemsets" << std::endl;
    stop_timer("Rule Generation", total_start, config.verbose);
    return rules;
}
