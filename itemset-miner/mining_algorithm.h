#pragma once

#include <limits>
#include <string>
#include <vector>
#include "types.h"
#include "cancel_token.h"

class TransactionDatabase;  // forward declaration
class PatternEmitter;

// Per-search parameters, thresholds already resolved to weights
struct MiningParams {
    Support min_support = 1.0;
    size_t zmin = 1;
    size_t zmax = std::numeric_limits<size_t>::max();
    const CancelToken* cancel = nullptr;  // optional
    int threads = 0;                      // 0 = OpenMP default
    bool verbose = false;
};

// Abstract interface for all itemset search strategies
class IMiningAlgorithm {
public:
    virtual ~IMiningAlgorithm() = default;

    // Human-readable name (for logs)
    virtual std::string name() const = 0;

    // Enumerates every itemset of `db` whose support reaches
    // params.min_support and whose size lies in [zmin, zmax], handing each
    // one to `out` exactly once. Stops early when `out` reports that the
    // consumer is done; throws AbortedError when cancelled.
    virtual void mine(const TransactionDatabase& db,
                      const MiningParams& params,
                      PatternEmitter& out) = 0;
};
