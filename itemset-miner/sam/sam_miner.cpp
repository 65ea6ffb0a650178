#include "sam_miner.h"
#include "../timer.h"
#include <iostream>

SamMiner::Rows SamMiner::merge(const Rows& a, size_t a_begin, const Rows& b) {
    Rows out;
    out.reserve(a.size() - a_begin + b.size());
    size_t i = a_begin, j = 0;
    while (i < a.size() && j < b.size()) {
        if (a[i].items < b[j].items) out.push_back(a[i++]);
        else if (b[j].items < a[i].items) out.push_back(b[j++]);
        else {
            out.push_back({a[i].items, a[i].weight + b[j].weight});
            ++i; ++j;
        }
    }
    while (i < a.size()) out.push_back(a[i++]);
    while (j < b.size()) out.push_back(b[j++]);
    return out;
}

bool SamMiner::recurse(Rows rows, std::vector<ItemCode>& prefix,
                       const MiningParams& params, PatternEmitter& out) {
    while (!rows.empty()) {
        out.checkpoint();

        // Split: the leading run shares the smallest first item
        ItemCode item = rows[0].items[0];
        Support support = 0;
        Rows suffixes;
        size_t split = 0;
        for (; split < rows.size() && rows[split].items[0] == item; ++split) {
            support += rows[split].weight;
            if (rows[split].items.size() > 1)
                suffixes.push_back({std::vector<ItemCode>(rows[split].items.begin() + 1,
                                                          rows[split].items.end()),
                                    rows[split].weight});
        }

        if (support >= params.min_support) {
            prefix.push_back(item);
            if (!out.emit(prefix, support)) return false;
            if (out.can_extend(prefix.size()) && !suffixes.empty() &&
                !recurse(suffixes, prefix, params, out))
                return false;
            prefix.pop_back();
        }

        // Merge: the item is eliminated, its suffixes rejoin the rest
        rows = merge(rows, split, suffixes);
    }
    return true;
}

void SamMiner::mine(const TransactionDatabase& db,
                    const MiningParams& params,
                    PatternEmitter& out) {
    auto mine_start = start_timer();
    if (!out.emit_empty(db)) return;

    std::vector<char> keep(db.item_count(), 0);
    for (ItemCode item : db.frequent_items(params.min_support)) keep[item] = 1;

    // Dropping items breaks the lexicographic order; the reduced database re-sorts
    Rows rows;
    for (const auto& t : db.merged()) {
        Transaction r{{}, t.weight};
        for (ItemCode x : t.items)
            if (keep[x]) r.items.push_back(x);
        if (!r.items.empty()) rows.push_back(std::move(r));
    }
    TransactionDatabase reduced(db.item_count(), std::move(rows));

    if (params.verbose)
        std::cout << "[LOG] sam: " << reduced.merged().size() << " distinct reduced transactions" << std::endl;

    std::vector<ItemCode> prefix;
    recurse(reduced.merged(), prefix, params, out);

    stop_timer("SaM (Split and Merge) Mining", mine_start, params.verbose);
}
