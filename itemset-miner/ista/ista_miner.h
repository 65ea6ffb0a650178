#pragma once

#include "../mining_algorithm.h"
#include "../transaction_database.h"
#include "../pattern_emitter.h"
#include <limits>
#include <unordered_map>
#include <vector>

// Prefix-tree accretion: one pass over the transactions grows a prefix tree
// holding every intersection of transactions (the closed itemsets) with its
// support. Frequent itemsets are then read off the tree, each one taking the
// largest support among its closed supersets.
class IstaMiner : public IMiningAlgorithm {
public:
    std::string name() const override { return "ista"; }

    void mine(const TransactionDatabase& db,
              const MiningParams& params,
              PatternEmitter& out) override;

private:
    static constexpr uint32_t kNone = std::numeric_limits<uint32_t>::max();

    struct PrefixNode {
        ItemCode item;
        uint32_t parent;
        uint32_t first_child;
        uint32_t next_sibling;
        Support support;
        bool stored;          // the path to this node is a closed itemset
    };

    struct Intersection {
        std::vector<ItemCode> items;
        Support support;      // before the current transaction
    };

    using IntersectionMap = std::unordered_map<std::vector<ItemCode>, Support, VectorHasher>;

    std::vector<PrefixNode> nodes;
    std::vector<char> in_transaction;

    uint32_t find_or_add(const std::vector<ItemCode>& items);
    void collect(uint32_t node, std::vector<ItemCode>& current, IntersectionMap& found) const;
    void add_transaction(const Transaction& t);

    std::vector<CodedItemset> closed_sets(Support min_support) const;

    bool expand(const std::vector<CodedItemset>& closed,
                const std::vector<uint32_t>& containing,
                std::vector<ItemCode>& prefix,
                PatternEmitter& out);
};
