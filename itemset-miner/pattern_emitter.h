#ifndef PATTERN_EMITTER_H
#define PATTERN_EMITTER_H

#include <functional>
#include <vector>
#include "types.h"
#include "mining_algorithm.h"

class TransactionDatabase;

// Receives (sorted items, support); returns false once it wants no more
using PatternSink = std::function<bool(const std::vector<ItemCode>&, Support)>;

// The output side every strategy writes to. Applies the size range, keeps
// the consumer's stop request and polls the cancel token.
class PatternEmitter {
private:
    const PatternSink& sink;
    const MiningParams& params;
    std::vector<ItemCode> scratch;
    size_t count = 0;
    bool done = false;

public:
    PatternEmitter(const PatternSink& sink, const MiningParams& params);

    // Items may come in any order. Returns false once the consumer stopped.
    bool emit(const std::vector<ItemCode>& items, Support support);

    // The empty itemset, reported only when zmin == 0
    bool emit_empty(const TransactionDatabase& db);

    // Whether itemsets of `size` may still grow
    bool can_extend(size_t size) const { return size < params.zmax; }

    // Throws AbortedError if cancellation was requested
    void checkpoint() const;

    size_t emitted() const { return count; }
};

#endif // PATTERN_EMITTER_H
