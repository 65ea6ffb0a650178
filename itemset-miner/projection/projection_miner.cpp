#include "projection_miner.h"
#include "../timer.h"
#include <iostream>

bool ProjectionMiner::recurse(const TransactionDatabase& db,
                              std::vector<ItemCode>& prefix,
                              const MiningParams& params,
                              PatternEmitter& out) {
    for (ItemCode item : db.frequent_items(params.min_support)) {
        out.checkpoint();

        prefix.push_back(item);
        if (!out.emit(prefix, db.item_support(item))) return false;

        if (out.can_extend(prefix.size())) {
            // Extensions only by larger codes, so each itemset is met once
            TransactionDatabase sub = db.project(item, params.min_support, true);
            ++projections;
            if (!recurse(sub, prefix, params, out)) return false;
        }
        prefix.pop_back();
    }
    return true;
}

void ProjectionMiner::mine(const TransactionDatabase& db,
                           const MiningParams& params,
                           PatternEmitter& out) {
    auto mine_start = start_timer();
    projections = 0;
    if (!out.emit_empty(db)) return;

    std::vector<ItemCode> prefix;
    recurse(db, prefix, params, out);

    if (params.verbose)
        std::cout << "[LOG] proj: " << projections << " projected databases" << std::endl;
    stop_timer("Database Projection Mining", mine_start, params.verbose);
}
