#include "fpgrowth_miner.h"
#include "../timer.h"
#include <algorithm>
#include <iostream>

FPTree FPGrowthMiner::project(const FPTree& tree, ItemCode item) const {
    // Only items ordered before `item` sit on its prefix paths
    FPTree cond(item);
    std::vector<Support> counts(item, 0);

    // 1. Support of every item inside the conditional pattern base
    for (uint32_t n = tree.head(item); n != kNoNode; n = tree.node(n).link) {
        Support c = tree.node(n).count;
        for (uint32_t a = tree.node(n).parent; a != 0; a = tree.node(a).parent)
            counts[tree.node(a).item] += c;
    }

    // 2. Insert each prefix path, reduced to its frequent items
    std::vector<ItemCode> path;
    for (uint32_t n = tree.head(item); n != kNoNode; n = tree.node(n).link) {
        path.clear();
        for (uint32_t a = tree.node(n).parent; a != 0; a = tree.node(a).parent) {
            if (counts[tree.node(a).item] >= min_support) path.push_back(tree.node(a).item);
        }
        if (path.empty()) continue;
        std::reverse(path.begin(), path.end());
        cond.insert(path, tree.node(n).count);
    }
    return cond;
}

bool FPGrowthMiner::grow(const FPTree& tree, std::vector<ItemCode>& prefix, PatternEmitter& out) {
    // Bottom-up over the header table: least frequent (largest code) first
    for (size_t k = tree.item_count(); k-- > 0;) {
        ItemCode item = (ItemCode)k;
        if (tree.head(item) == kNoNode || tree.support(item) < min_support) continue;
        out.checkpoint();

        prefix.push_back(item);
        if (!out.emit(prefix, tree.support(item))) return false;

        if (out.can_extend(prefix.size())) {
            FPTree cond = project(tree, item);
            ++trees_built;
            if (!cond.empty() && !grow(cond, prefix, out)) return false;
        }
        prefix.pop_back();
    }
    return true;
}

void FPGrowthMiner::mine(const TransactionDatabase& db,
                         const MiningParams& params,
                         PatternEmitter& out) {
    auto mine_start = start_timer();
    min_support = params.min_support;
    trees_built = 0;
    if (!out.emit_empty(db)) return;

    std::vector<char> keep(db.item_count(), 0);
    for (ItemCode item : db.frequent_items(min_support)) keep[item] = 1;

    FPTree tree(db.item_count());
    std::vector<ItemCode> items;
    for (const auto& t : db.merged()) {
        items.clear();
        for (ItemCode x : t.items)
            if (keep[x]) items.push_back(x);
        if (!items.empty()) tree.insert(items, t.weight);
    }

    if (params.verbose)
        std::cout << "[LOG] fpgrowth: initial tree has " << tree.node_count() << " nodes" << std::endl;

    std::vector<ItemCode> prefix;
    grow(tree, prefix, out);

    if (params.verbose)
        std::cout << "[LOG] fpgrowth: " << trees_built << " conditional trees built" << std::endl;
    stop_timer("FP-growth (Tree Projection) Mining", mine_start, params.verbose);
}
