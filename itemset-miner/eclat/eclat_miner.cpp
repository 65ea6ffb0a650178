#include "eclat_miner.h"
#include "../timer.h"
#include <iostream>

Support EclatMiner::intersect(const std::vector<Transaction>& rows,
                              const std::vector<uint32_t>& a,
                              const std::vector<uint32_t>& b,
                              std::vector<uint32_t>& dst) {
    dst.clear();
    Support weight = 0;
    size_t i = 0, j = 0;
    while (i < a.size() && j < b.size()) {
        if (a[i] < b[j]) ++i;
        else if (b[j] < a[i]) ++j;
        else {
            dst.push_back(a[i]);
            weight += rows[a[i]].weight;
            ++i; ++j;
        }
    }
    return weight;
}

bool EclatMiner::recurse(const std::vector<Transaction>& rows,
                         std::vector<ItemCode>& prefix,
                         const std::vector<TidList>& exts,
                         Support min_support,
                         PatternEmitter& out) {
    for (size_t i = 0; i < exts.size(); ++i) {
        out.checkpoint();

        prefix.push_back(exts[i].item);
        if (!out.emit(prefix, exts[i].support)) return false;

        if (out.can_extend(prefix.size())) {
            // Conditional lists for the items after exts[i]
            std::vector<TidList> next;
            for (size_t j = i + 1; j < exts.size(); ++j) {
                TidList cand{exts[j].item, 0, {}};
                cand.support = intersect(rows, exts[i].tids, exts[j].tids, cand.tids);
                if (cand.support >= min_support) next.push_back(std::move(cand));
            }
            if (!next.empty() && !recurse(rows, prefix, next, min_support, out)) return false;
        }
        prefix.pop_back();
    }
    return true;
}

void EclatMiner::mine(const TransactionDatabase& db,
                      const MiningParams& params,
                      PatternEmitter& out) {
    auto mine_start = start_timer();
    if (!out.emit_empty(db)) return;

    // Initial vertical representation of the frequent items
    std::vector<ItemCode> frequent = db.frequent_items(params.min_support);
    std::vector<std::vector<uint32_t>> lists = db.vertical_lists((ItemCode)db.item_count());

    std::vector<TidList> root;
    root.reserve(frequent.size());
    for (ItemCode item : frequent)
        root.push_back({item, db.item_support(item), std::move(lists[item])});

    if (params.verbose)
        std::cout << "[LOG] eclat: " << root.size() << " frequent items, "
                  << db.merged().size() << " distinct transactions" << std::endl;

    std::vector<ItemCode> prefix;
    recurse(db.merged(), prefix, root, params.min_support, out);

    stop_timer("Eclat (Vertical Intersection) Mining", mine_start, params.verbose);
}
