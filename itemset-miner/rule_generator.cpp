#include "rule_generator.h"
#include "errors.h"
#include "support.h"
#include <algorithm>
#include <unordered_map>

namespace {

using SupportMap = std::unordered_map<std::vector<ItemCode>, Support, VectorHasher>;

Support lookup_support(const SupportMap& supports, const std::vector<ItemCode>& items,
                       const char* role) {
    auto it = supports.find(items);
    if (it == supports.end())
        throw MissingSupportDataError(std::string("No support retained for rule ") + role +
                                      " of size " + std::to_string(items.size()));
    return it->second;
}

// Advances `pos` to the next k-combination of [0, n); false after the last
bool next_combination(std::vector<size_t>& pos, size_t n) {
    size_t k = pos.size();
    for (size_t i = k; i-- > 0;) {
        if (pos[i] < n - k + i) {
            ++pos[i];
            for (size_t j = i + 1; j < k; ++j) pos[j] = pos[j - 1] + 1;
            return true;
        }
    }
    return false;
}

} // namespace

Appearance parse_appearance(const std::string& code) {
    if (code == "-" || code == "n" || code == "none" || code == "neither" ||
        code == "ign" || code == "ignore")
        return Appearance::None;
    if (code == "a" || code == "i" || code == "b" || code == "in" || code == "inp" ||
        code == "input" || code == "ante" || code == "antecedent" || code == "body")
        return Appearance::Body;
    if (code == "c" || code == "o" || code == "h" || code == "out" || code == "output" ||
        code == "cons" || code == "consequent" || code == "head")
        return Appearance::Head;
    if (code == "x" || code == "io" || code == "i&o" || code == "o&i" || code == "inout" ||
        code == "in&out" || code == "ac" || code == "a&c" || code == "c&a" || code == "canda" ||
        code == "bh" || code == "b&h" || code == "h&b" || code == "both")
        return Appearance::Both;

    throw InvalidConfigError("Invalid item appearance indicator: " + code);
}

RuleGenerator::RuleGenerator(RuleOptions options, RuleEvaluator evaluator)
    : options(std::move(options)), evaluator(std::move(evaluator)) {
    if (!(this->options.min_confidence >= 0.0 && this->options.min_confidence <= 100.0))
        throw InvalidConfigError("Minimum confidence must lie in [0, 100]");
}

std::vector<Rule> RuleGenerator::generate(const std::vector<CodedItemset>& itemsets,
                                          const TransactionDatabase& db,
                                          const ItemEncoder& encoder) const {
    SupportMap supports;
    supports.reserve(itemsets.size());
    for (const auto& s : itemsets) {
        std::vector<ItemCode> key = s.items;
        std::sort(key.begin(), key.end());
        supports.emplace(std::move(key), s.support);
    }

    // Appearance per item code
    std::vector<Appearance> appear(encoder.item_count(), options.default_appearance);
    if (!options.appearances.empty()) {
        const std::vector<Item>& names = encoder.items();
        for (ItemCode c = 0; c < (ItemCode)names.size(); ++c) {
            auto it = options.appearances.find(names[c]);
            if (it != options.appearances.end()) appear[c] = it->second;
        }
    }
    auto in_body = [&](ItemCode x) { return appear[x] == Appearance::Body || appear[x] == Appearance::Both; };
    auto in_head = [&](ItemCode x) { return appear[x] == Appearance::Head || appear[x] == Appearance::Both; };

    const Support total = db.total_weight();
    const double min_conf = options.min_confidence / 100.0 * (1 - kSupportEpsilon);

    std::vector<Rule> rules;
    std::vector<ItemCode> items, body, head;
    std::vector<size_t> pos;

    for (const auto& s : itemsets) {
        if (s.items.size() < std::max<size_t>(2, options.min_items)) continue;
        if (options.original_support &&
            (s.support < options.min_support || s.support > options.max_support))
            continue;
        if (options.cancel && options.cancel->requested())
            throw AbortedError("Rule generation aborted by cancellation request");

        items = s.items;
        std::sort(items.begin(), items.end());
        if (std::any_of(items.begin(), items.end(),
                        [&](ItemCode x) { return appear[x] == Appearance::None; }))
            continue;
        const size_t n = items.size();

        for (size_t k = options.single_consequent ? n - 1 : 1; k < n; ++k) {
            pos.resize(k);
            for (size_t i = 0; i < k; ++i) pos[i] = i;

            do {
                body.clear();
                head.clear();
                for (size_t i = 0, p = 0; i < n; ++i) {
                    if (p < k && pos[p] == i) { body.push_back(items[i]); ++p; }
                    else head.push_back(items[i]);
                }
                if (!std::all_of(body.begin(), body.end(), in_body) ||
                    !std::all_of(head.begin(), head.end(), in_head))
                    continue;

                Support body_supp = lookup_support(supports, body, "antecedent");
                Support rule_supp = options.original_support ? s.support : body_supp;
                if (!options.original_support &&
                    (rule_supp < options.min_support || rule_supp > options.max_support))
                    continue;

                double conf = s.support / body_supp;
                if (conf < min_conf) continue;

                Support head_supp = lookup_support(supports, head, "consequent");
                double lift = conf * total / head_supp;
                if (lift < options.min_lift) continue;

                Rule r;
                r.antecedent = encoder.decode(body);
                r.consequent = encoder.decode(head);
                r.support = rule_supp;
                r.confidence = conf;
                r.lift = lift;
                if (evaluator) r.measures = evaluator({body_supp, head_supp, s.support, total});
                rules.push_back(std::move(r));
            } while (next_combination(pos, n));
        }
    }
    return rules;
}
