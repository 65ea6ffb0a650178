#pragma once

#include "../mining_algorithm.h"
#include "../transaction_database.h"
#include "../pattern_emitter.h"
#include "fp_tree.h"
#include <vector>

// Tree projection: FP-tree plus recursively projected conditional trees
class FPGrowthMiner : public IMiningAlgorithm {
public:
    std::string name() const override { return "fpgrowth"; }

    void mine(const TransactionDatabase& db,
              const MiningParams& params,
              PatternEmitter& out) override;

private:
    Support min_support = 1;
    size_t trees_built = 0;

    bool grow(const FPTree& tree, std::vector<ItemCode>& prefix, PatternEmitter& out);

    // Conditional tree of the prefix paths leading to `item`
    FPTree project(const FPTree& tree, ItemCode item) const;
};
