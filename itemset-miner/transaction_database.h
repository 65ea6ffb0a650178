#ifndef TRANSACTION_DATABASE_H
#define TRANSACTION_DATABASE_H

#include <vector>
#include "types.h"

// Encoded transactions plus their aggregate statistics. Immutable once built;
// all derived views (merged, projections, vertical lists) are fresh snapshots.
class TransactionDatabase {
private:
    size_t n_items = 0;
    std::vector<Transaction> rows;          // insertion order
    std::vector<Transaction> merged_rows;   // sorted, identical rows merged
    std::vector<Support> supports;          // per item code
    Support total = 0;

    void build_merged();

public:
    TransactionDatabase() = default;

    // Items of each transaction are sorted and de-duplicated here; a code
    // outside [0, item_count) throws InvalidInputError.
    TransactionDatabase(size_t item_count, std::vector<Transaction> transactions);

    size_t item_count() const { return n_items; }
    size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }

    Support total_weight() const { return total; }
    Support item_support(ItemCode item) const { return supports[item]; }

    const std::vector<Transaction>& transactions() const { return rows; }
    const std::vector<Transaction>& merged() const { return merged_rows; }

    // Codes whose support reaches min_support, ascending
    std::vector<ItemCode> frequent_items(Support min_support) const;

    // Transactions containing `item`, with `item` removed and every item whose
    // support inside the projection is below min_support removed. With
    // suffix_only, items with a smaller code than `item` are dropped too.
    // Transactions that become empty are kept since they still carry weight.
    TransactionDatabase project(ItemCode item, Support min_support, bool suffix_only = false) const;

    // Ascending indices into merged() of the transactions containing `item`
    std::vector<uint32_t> vertical_list(ItemCode item) const;

    // vertical_list() for all codes below `limit`, in a single pass
    std::vector<std::vector<uint32_t>> vertical_lists(ItemCode limit) const;
};

#endif // TRANSACTION_DATABASE_H
