#pragma once

#include "../mining_algorithm.h"
#include "../transaction_database.h"
#include "../pattern_emitter.h"
#include <vector>

// Breadth-first (level-wise) search with a candidate trie
class AprioriMiner : public IMiningAlgorithm {
public:
    std::string name() const override { return "apriori"; }

    void mine(const TransactionDatabase& db,
              const MiningParams& params,
              PatternEmitter& out) override;

private:
    // Trie node in an index arena; the children of a node are contiguous
    // and sorted by item, so every level is a run of the arena.
    struct TrieNode {
        ItemCode item;
        uint32_t parent;
        uint32_t child_begin;
        uint32_t child_end;
        Support support;
        bool frequent;
    };

    std::vector<TrieNode> nodes;

    std::vector<ItemCode> path(uint32_t node) const;
    bool contains_frequent(const std::vector<ItemCode>& items) const;

    // Appends the candidates of the next level; returns how many were added
    size_t generate(uint32_t level_begin, uint32_t level_end, PatternEmitter& out);

    void count_level(const std::vector<Transaction>& rows, size_t depth,
                     uint32_t cand_begin, uint32_t cand_end, int threads);

    void count_transaction(const Transaction& t, size_t pos, uint32_t node, size_t depth,
                           size_t target, uint32_t cand_begin,
                           std::vector<Support>& counts) const;
};
