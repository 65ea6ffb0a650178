#pragma once

#include "../mining_algorithm.h"
#include "../transaction_database.h"
#include "../pattern_emitter.h"
#include <vector>

// Depth-first search over recursively projected transaction databases
class ProjectionMiner : public IMiningAlgorithm {
public:
    std::string name() const override { return "proj"; }

    void mine(const TransactionDatabase& db,
              const MiningParams& params,
              PatternEmitter& out) override;

private:
    size_t projections = 0;

    bool recurse(const TransactionDatabase& db,
                 std::vector<ItemCode>& prefix,
                 const MiningParams& params,
                 PatternEmitter& out);
};
