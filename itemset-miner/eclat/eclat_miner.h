#pragma once

#include "../mining_algorithm.h"
#include "../transaction_database.h"
#include "../pattern_emitter.h"
#include <vector>

// Depth-first search over vertical transaction lists
class EclatMiner : public IMiningAlgorithm {
public:
    std::string name() const override { return "eclat"; }

    void mine(const TransactionDatabase& db,
              const MiningParams& params,
              PatternEmitter& out) override;

private:
    struct TidList {
        ItemCode item;
        Support support;
        std::vector<uint32_t> tids;   // indices into db.merged()
    };

    bool recurse(const std::vector<Transaction>& rows,
                 std::vector<ItemCode>& prefix,
                 const std::vector<TidList>& exts,
                 Support min_support,
                 PatternEmitter& out);

    // dst = a & b; returns the weight of dst
    static Support intersect(const std::vector<Transaction>& rows,
                             const std::vector<uint32_t>& a,
                             const std::vector<uint32_t>& b,
                             std::vector<uint32_t>& dst);
};
