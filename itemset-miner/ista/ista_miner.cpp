#include "ista_miner.h"
#include "../support.h"
#include "../timer.h"
#include <algorithm>
#include <iostream>

uint32_t IstaMiner::find_or_add(const std::vector<ItemCode>& items) {
    uint32_t current = 0;
    for (ItemCode item : items) {
        // Sibling lists are kept sorted by item
        uint32_t prev = kNone;
        uint32_t child = nodes[current].first_child;
        while (child != kNone && nodes[child].item < item) {
            prev = child;
            child = nodes[child].next_sibling;
        }
        if (child == kNone || nodes[child].item != item) {
            uint32_t fresh = (uint32_t)nodes.size();
            nodes.push_back({item, current, kNone, child, 0, false});
            if (prev == kNone) nodes[current].first_child = fresh;
            else nodes[prev].next_sibling = fresh;
            child = fresh;
        }
        current = child;
    }
    return current;
}

void IstaMiner::collect(uint32_t node, std::vector<ItemCode>& current, IntersectionMap& found) const {
    for (uint32_t c = nodes[node].first_child; c != kNone; c = nodes[c].next_sibling) {
        bool member = in_transaction[nodes[c].item] != 0;
        if (member) current.push_back(nodes[c].item);

        // The set stored at c, cut down to the transaction, is `current`
        if (nodes[c].stored && !current.empty()) {
            auto it = found.find(current);
            if (it == found.end()) found.emplace(current, nodes[c].support);
            else it->second = std::max(it->second, nodes[c].support);
        }
        collect(c, current, found);

        if (member) current.pop_back();
    }
}

void IstaMiner::add_transaction(const Transaction& t) {
    for (ItemCode x : t.items) in_transaction[x] = 1;
    IntersectionMap found;
    std::vector<ItemCode> current;
    collect(0, current, found);
    found.emplace(t.items, 0);   // the transaction itself, if not yet known
    for (ItemCode x : t.items) in_transaction[x] = 0;

    std::vector<Intersection> isects;
    isects.reserve(found.size());
    for (auto& entry : found) isects.push_back({entry.first, entry.second});
    std::sort(isects.begin(), isects.end(), [](const Intersection& a, const Intersection& b) {
        return a.items.size() > b.items.size();
    });

    auto includes = [&](size_t sup, size_t sub) {
        return isects[sup].items.size() > isects[sub].items.size() &&
               std::includes(isects[sup].items.begin(), isects[sup].items.end(),
                             isects[sub].items.begin(), isects[sub].items.end());
    };

    // Old support of X is the best support among the intersections
    // containing it; the transaction adds its weight to all of them.
    std::vector<Support> updated(isects.size());
    for (size_t i = 0; i < isects.size(); ++i) {
        Support old = isects[i].support;
        for (size_t j = 0; j < i; ++j)
            if (includes(j, i)) old = std::max(old, isects[j].support);
        updated[i] = old + t.weight;
    }

    // Keep only the sets that are closed after this transaction
    for (size_t i = 0; i < isects.size(); ++i) {
        bool closed = true;
        for (size_t j = 0; j < i && closed; ++j)
            if (same_support(updated[j], updated[i]) && includes(j, i)) closed = false;
        if (!closed) continue;

        uint32_t node = find_or_add(isects[i].items);
        nodes[node].support = updated[i];
        nodes[node].stored = true;
    }
}

std::vector<CodedItemset> IstaMiner::closed_sets(Support min_support) const {
    std::vector<CodedItemset> found;
    std::vector<ItemCode> path;

    // Iterative preorder walk over the arena
    std::vector<std::pair<uint32_t, size_t>> stack;   // (node, depth)
    for (uint32_t c = nodes[0].first_child; c != kNone; c = nodes[c].next_sibling)
        stack.push_back({c, 0});
    std::reverse(stack.begin(), stack.end());

    while (!stack.empty()) {
        auto [node, depth] = stack.back();
        stack.pop_back();
        path.resize(depth);
        path.push_back(nodes[node].item);
        if (nodes[node].stored && nodes[node].support >= min_support)
            found.push_back({path, nodes[node].support});

        size_t mark = stack.size();
        for (uint32_t c = nodes[node].first_child; c != kNone; c = nodes[c].next_sibling)
            stack.push_back({c, depth + 1});
        std::reverse(stack.begin() + mark, stack.end());
    }
    return found;
}

bool IstaMiner::expand(const std::vector<CodedItemset>& closed,
                       const std::vector<uint32_t>& containing,
                       std::vector<ItemCode>& prefix,
                       PatternEmitter& out) {
    // Extension candidates: items after the prefix in any closed superset
    std::vector<ItemCode> cands;
    for (uint32_t idx : containing) {
        const auto& items = closed[idx].items;
        auto first = prefix.empty() ? items.begin()
                                    : std::upper_bound(items.begin(), items.end(), prefix.back());
        cands.insert(cands.end(), first, items.end());
    }
    std::sort(cands.begin(), cands.end());
    cands.erase(std::unique(cands.begin(), cands.end()), cands.end());

    std::vector<uint32_t> sub;
    for (ItemCode item : cands) {
        out.checkpoint();

        sub.clear();
        Support best = 0;
        for (uint32_t idx : containing) {
            const auto& items = closed[idx].items;
            if (std::binary_search(items.begin(), items.end(), item)) {
                sub.push_back(idx);
                best = std::max(best, closed[idx].support);
            }
        }

        prefix.push_back(item);
        if (!out.emit(prefix, best)) return false;
        if (out.can_extend(prefix.size()) && !expand(closed, sub, prefix, out)) return false;
        prefix.pop_back();
    }
    return true;
}

void IstaMiner::mine(const TransactionDatabase& db,
                     const MiningParams& params,
                     PatternEmitter& out) {
    auto mine_start = start_timer();
    nodes.clear();
    nodes.push_back({0, kNone, kNone, kNone, 0, false});
    in_transaction.assign(db.item_count(), 0);
    if (!out.emit_empty(db)) return;

    std::vector<char> keep(db.item_count(), 0);
    for (ItemCode item : db.frequent_items(params.min_support)) keep[item] = 1;

    // Single scan: accrete every transaction into the prefix tree
    Transaction reduced;
    for (const auto& t : db.merged()) {
        out.checkpoint();
        reduced.items.clear();
        reduced.weight = t.weight;
        for (ItemCode x : t.items)
            if (keep[x]) reduced.items.push_back(x);
        if (!reduced.items.empty()) add_transaction(reduced);
    }

    std::vector<CodedItemset> closed = closed_sets(params.min_support);
    if (params.verbose)
        std::cout << "[LOG] ista: prefix tree with " << nodes.size() << " nodes, "
                  << closed.size() << " closed frequent itemsets" << std::endl;

    std::vector<uint32_t> all(closed.size());
    for (uint32_t i = 0; i < (uint32_t)all.size(); ++i) all[i] = i;
    std::vector<ItemCode> prefix;
    expand(closed, all, prefix, out);

    stop_timer("IsTa (Prefix Tree Accretion) Mining", mine_start, params.verbose);
}
