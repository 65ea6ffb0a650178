#include "pattern_emitter.h"
#include "errors.h"
#include "transaction_database.h"
#include <algorithm>

PatternEmitter::PatternEmitter(const PatternSink& sink, const MiningParams& params)
    : sink(sink), params(params) {}

bool PatternEmitter::emit(const std::vector<ItemCode>& items, Support support) {
    if (done) return false;
    if (items.size() < params.zmin) return true;
    if (items.size() > params.zmax) return true;

    scratch.assign(items.begin(), items.end());
    std::sort(scratch.begin(), scratch.end());
    ++count;
    if (!sink(scratch, support)) done = true;
    return !done;
}

bool PatternEmitter::emit_empty(const TransactionDatabase& db) {
    if (params.zmin != 0 || db.total_weight() < params.min_support) return !done;
    return emit({}, db.total_weight());
}

void PatternEmitter::checkpoint() const {
    if (params.cancel && params.cancel->requested())
        throw AbortedError("Search aborted by cancellation request");
}
