#include "apriori_miner.h"
#include "../timer.h"
#include <algorithm>
#include <iostream>
#include <omp.h>

std::vector<ItemCode> AprioriMiner::path(uint32_t node) const {
    std::vector<ItemCode> items;
    while (node != 0) {
        items.push_back(nodes[node].item);
        node = nodes[node].parent;
    }
    std::reverse(items.begin(), items.end());
    return items;
}

bool AprioriMiner::contains_frequent(const std::vector<ItemCode>& items) const {
    uint32_t node = 0;
    for (ItemCode item : items) {
        auto first = nodes.begin() + nodes[node].child_begin;
        auto last = nodes.begin() + nodes[node].child_end;
        auto it = std::lower_bound(first, last, item,
                                   [](const TrieNode& n, ItemCode x) { return n.item < x; });
        if (it == last || it->item != item || !it->frequent) return false;
        node = (uint32_t)(it - nodes.begin());
    }
    return true;
}

size_t AprioriMiner::generate(uint32_t level_begin, uint32_t level_end, PatternEmitter& out) {
    size_t before = nodes.size();
    std::vector<ItemCode> subset;

    for (uint32_t x = level_begin; x < level_end; ++x) {
        nodes[x].child_begin = nodes[x].child_end = (uint32_t)nodes.size();
        if (!nodes[x].frequent) continue;
        out.checkpoint();

        std::vector<ItemCode> base = path(x);
        uint32_t sib_end = nodes[nodes[x].parent].child_end;

        // Extend x by each larger frequent sibling y
        for (uint32_t y = x + 1; y < sib_end; ++y) {
            if (!nodes[y].frequent) continue;
            ItemCode extension = nodes[y].item;

            // Every subset of size k must be frequent; dropping the last
            // element of base gives y itself and dropping y gives x.
            bool viable = true;
            for (size_t drop = 0; drop + 1 < base.size() && viable; ++drop) {
                subset.clear();
                for (size_t k = 0; k < base.size(); ++k)
                    if (k != drop) subset.push_back(base[k]);
                subset.push_back(extension);
                viable = contains_frequent(subset);
            }
            if (!viable) continue;

            nodes.push_back({extension, x, 0, 0, 0, false});
        }
        nodes[x].child_end = (uint32_t)nodes.size();
    }
    // Fresh candidates have no children yet
    for (size_t c = before; c < nodes.size(); ++c)
        nodes[c].child_begin = nodes[c].child_end = (uint32_t)nodes.size();

    return nodes.size() - before;
}

void AprioriMiner::count_transaction(const Transaction& t, size_t pos, uint32_t node,
                                     size_t depth, size_t target, uint32_t cand_begin,
                                     std::vector<Support>& counts) const {
    uint32_t c = nodes[node].child_begin;
    uint32_t c_end = nodes[node].child_end;

    // Merge the sorted children against the rest of the sorted transaction
    while (c < c_end && pos < t.items.size()) {
        if (t.items.size() - pos < target - depth) return;  // too few items left
        ItemCode a = nodes[c].item;
        ItemCode b = t.items[pos];
        if (a < b) { ++c; continue; }
        if (b < a) { ++pos; continue; }

        if (depth + 1 == target)
            counts[c - cand_begin] += t.weight;
        else if (nodes[c].frequent)
            count_transaction(t, pos + 1, c, depth + 1, target, cand_begin, counts);
        ++c; ++pos;
    }
}

void AprioriMiner::count_level(const std::vector<Transaction>& rows, size_t depth,
                               uint32_t cand_begin, uint32_t cand_end, int threads) {
    size_t n_cand = cand_end - cand_begin;
    std::vector<Support> counts(n_cand, 0);
    int n_threads = threads > 0 ? threads : omp_get_max_threads();

    #pragma omp parallel num_threads(n_threads)
    {
        std::vector<Support> local(n_cand, 0);

        #pragma omp for schedule(dynamic, 256)
        for (long i = 0; i < (long)rows.size(); ++i) {
            if (rows[i].items.size() < depth) continue;
            count_transaction(rows[i], 0, 0, 0, depth, cand_begin, local);
        }

        #pragma omp critical
        {
            for (size_t k = 0; k < n_cand; ++k) counts[k] += local[k];
        }
    }

    for (size_t k = 0; k < n_cand; ++k) nodes[cand_begin + k].support = counts[k];
}

void AprioriMiner::mine(const TransactionDatabase& db,
                        const MiningParams& params,
                        PatternEmitter& out) {
    auto mine_start = start_timer();
    nodes.clear();
    if (!out.emit_empty(db)) return;

    // Level 1 straight from the item supports
    std::vector<ItemCode> frequent = db.frequent_items(params.min_support);
    nodes.push_back({0, 0, 1, (uint32_t)(1 + frequent.size()), db.total_weight(), true});
    for (ItemCode item : frequent) {
        uint32_t end = (uint32_t)(1 + frequent.size());
        nodes.push_back({item, 0, end, end, db.item_support(item), true});
    }

    // Transactions reduced to the frequent items; level k+1 needs k+1 items
    std::vector<char> keep(db.item_count(), 0);
    for (ItemCode item : frequent) keep[item] = 1;
    std::vector<Transaction> rows;
    for (const auto& t : db.merged()) {
        Transaction r{{}, t.weight};
        for (ItemCode x : t.items)
            if (keep[x]) r.items.push_back(x);
        if (r.items.size() >= 2) rows.push_back(std::move(r));
    }

    uint32_t level_begin = 1;
    uint32_t level_end = (uint32_t)nodes.size();
    size_t depth = 1;

    while (level_begin < level_end) {
        for (uint32_t n = level_begin; n < level_end; ++n) {
            if (nodes[n].frequent && !out.emit(path(n), nodes[n].support)) return;
        }
        if (!out.can_extend(depth)) break;

        size_t added = generate(level_begin, level_end, out);
        if (added == 0) break;

        uint32_t cand_begin = level_end;
        uint32_t cand_end = (uint32_t)nodes.size();
        ++depth;
        out.checkpoint();
        count_level(rows, depth, cand_begin, cand_end, params.threads);

        size_t survivors = 0;
        for (uint32_t c = cand_begin; c < cand_end; ++c) {
            nodes[c].frequent = nodes[c].support >= params.min_support;
            survivors += nodes[c].frequent;
        }
        if (params.verbose)
            std::cout << "[LOG] apriori: level " << depth << ", " << added
                      << " candidates, " << survivors << " frequent" << std::endl;
        if (survivors == 0) break;

        level_begin = cand_begin;
        level_end = cand_end;
    }

    stop_timer("Apriori (Level-wise) Mining", mine_start, params.verbose);
}
