#include "transaction_database.h"
#include "errors.h"
#include "support.h"
#include <algorithm>
#include <execution>
#include <string>

TransactionDatabase::TransactionDatabase(size_t item_count, std::vector<Transaction> transactions)
    : n_items(item_count), rows(std::move(transactions)), supports(item_count, 0) {
    for (auto& t : rows) {
        if (t.weight <= 0)
            throw InvalidInputError("Transaction weight must be positive");

        std::sort(t.items.begin(), t.items.end());
        t.items.erase(std::unique(t.items.begin(), t.items.end()), t.items.end());

        total = checked_add(total, t.weight);
        for (ItemCode item : t.items) {
            if (item >= n_items)
                throw InvalidInputError("Item code " + std::to_string(item) +
                                        " outside of [0, " + std::to_string(n_items) + ")");
            supports[item] = checked_add(supports[item], t.weight);
        }
    }
    build_merged();
}

void TransactionDatabase::build_merged() {
    merged_rows = rows;
    std::sort(std::execution::par, merged_rows.begin(), merged_rows.end(),
              [](const Transaction& a, const Transaction& b) { return a.items < b.items; });

    // Fold runs of identical transactions into their first element
    size_t out = 0;
    for (size_t i = 0; i < merged_rows.size(); ++i) {
        if (out > 0 && merged_rows[out - 1].items == merged_rows[i].items) {
            merged_rows[out - 1].weight = checked_add(merged_rows[out - 1].weight, merged_rows[i].weight);
        } else {
            if (out != i) merged_rows[out] = std::move(merged_rows[i]);
            ++out;
        }
    }
    merged_rows.resize(out);
}

std::vector<ItemCode> TransactionDatabase::frequent_items(Support min_support) const {
    std::vector<ItemCode> items;
    for (ItemCode i = 0; i < (ItemCode)n_items; ++i) {
        if (supports[i] >= min_support) items.push_back(i);
    }
    return items;
}

TransactionDatabase TransactionDatabase::project(ItemCode item, Support min_support, bool suffix_only) const {
    std::vector<Transaction> selected;
    std::vector<Support> local(n_items, 0);

    // 1. Select the transactions containing the pivot and cut the pivot out
    for (const auto& t : merged_rows) {
        auto it = std::lower_bound(t.items.begin(), t.items.end(), item);
        if (it == t.items.end() || *it != item) continue;

        Transaction p;
        p.weight = t.weight;
        if (!suffix_only) p.items.assign(t.items.begin(), it);
        p.items.insert(p.items.end(), it + 1, t.items.end());
        for (ItemCode x : p.items) local[x] += t.weight;
        selected.push_back(std::move(p));
    }

    // 2. Drop the items that do not co-occur often enough with the pivot
    for (auto& p : selected) {
        p.items.erase(std::remove_if(p.items.begin(), p.items.end(),
                                     [&](ItemCode x) { return local[x] < min_support; }),
                      p.items.end());
    }

    return TransactionDatabase(n_items, std::move(selected));
}

std::vector<uint32_t> TransactionDatabase::vertical_list(ItemCode item) const {
    std::vector<uint32_t> tids;
    for (uint32_t i = 0; i < (uint32_t)merged_rows.size(); ++i) {
        const auto& items = merged_rows[i].items;
        if (std::binary_search(items.begin(), items.end(), item)) tids.push_back(i);
    }
    return tids;
}

std::vector<std::vector<uint32_t>> TransactionDatabase::vertical_lists(ItemCode limit) const {
    std::vector<std::vector<uint32_t>> lists(std::min<size_t>(limit, n_items));
    for (uint32_t i = 0; i < (uint32_t)merged_rows.size(); ++i) {
        for (ItemCode x : merged_rows[i].items) {
            if (x >= lists.size()) break;
            lists[x].push_back(i);
        }
    }
    return lists;
}
