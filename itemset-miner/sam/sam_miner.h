#pragma once

#include "../mining_algorithm.h"
#include "../transaction_database.h"
#include "../pattern_emitter.h"
#include <vector>

// Split and merge over a lexicographically sorted transaction array
class SamMiner : public IMiningAlgorithm {
public:
    std::string name() const override { return "sam"; }

    void mine(const TransactionDatabase& db,
              const MiningParams& params,
              PatternEmitter& out) override;

private:
    using Rows = std::vector<Transaction>;

    bool recurse(Rows rows, std::vector<ItemCode>& prefix,
                 const MiningParams& params, PatternEmitter& out);

    // Merges two sorted arrays, folding identical transactions together
    static Rows merge(const Rows& a, size_t a_begin, const Rows& b);
};
