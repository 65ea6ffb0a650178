#include "closure_index.h"
#include "errors.h"
#include "support.h"
#include <algorithm>
#include <string>

namespace {

std::string describe(const std::vector<ItemCode>& items) {
    std::string s = "{";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) s += ",";
        s += std::to_string(items[i]);
    }
    return s + "}";
}

} // namespace

ClosureIndex::ClosureIndex(ClosureMode mode) : mode_(mode) {}

uint64_t ClosureIndex::signature_of(const std::vector<ItemCode>& items) {
    uint64_t sig = 0;
    for (ItemCode x : items) sig |= uint64_t(1) << (x & 63);
    return sig;
}

bool ClosureIndex::is_subset(const Entry& sub, const Entry& sup) {
    if (sub.items.size() > sup.items.size()) return false;
    if (sub.signature & ~sup.signature) return false;
    return std::includes(sup.items.begin(), sup.items.end(),
                         sub.items.begin(), sub.items.end());
}

// Supports equal up to summation order share one bucket, keyed by the
// first of them seen
std::vector<uint32_t>& ClosureIndex::bucket_for(Support support) {
    auto it = buckets.lower_bound(support * (1 - kSupportEpsilon));
    if (it != buckets.end() && same_support(it->first, support)) return it->second;
    return buckets[support];
}

void ClosureIndex::evict(uint32_t id) {
    entries[id].alive = false;
    --live;
    ++dead;
}

bool ClosureIndex::accept(const std::vector<ItemCode>& items, Support support) {
    Entry e{items, support, 0, true};
    std::sort(e.items.begin(), e.items.end());
    e.items.erase(std::unique(e.items.begin(), e.items.end()), e.items.end());
    e.signature = signature_of(e.items);

    switch (mode_) {
        case ClosureMode::Closed:
            return accept_closed(e);
        case ClosureMode::Maximal:
            return accept_maximal(e);
        case ClosureMode::Generators:
            break;
    }

    // Generators are decided once all supports are known
    if (lookup.count(e.items)) return false;
    uint32_t id = (uint32_t)entries.size();
    lookup.emplace(e.items, id);
    entries.push_back(std::move(e));
    ++live;
    return true;
}

bool ClosureIndex::accept_closed(Entry& e) {
    // Only itemsets of the same support can subsume each other
    std::vector<uint32_t>& bucket = bucket_for(e.support);

    for (uint32_t id : bucket) {
        const Entry& y = entries[id];
        if (y.alive && is_subset(e, y)) return false;
    }

    uint32_t fresh = (uint32_t)entries.size();
    entries.push_back(std::move(e));
    ++live;
    const Entry& added = entries[fresh];

    bool evicted = false;
    for (uint32_t id : bucket) {
        if (entries[id].alive && is_subset(entries[id], added)) {
            evict(id);
            evicted = true;
        }
    }
    if (evicted) {
        bucket.erase(std::remove_if(bucket.begin(), bucket.end(),
                                    [&](uint32_t id) { return !entries[id].alive; }),
                     bucket.end());
    }
    bucket.push_back(fresh);
    return true;
}

bool ClosureIndex::accept_maximal(Entry& e) {
    // 1. Superset query over the shortest posting list among e's items
    if (e.items.empty()) {
        if (live > 0) return false;
    } else {
        if (postings.size() <= e.items.back()) postings.resize(e.items.back() + 1);
        const std::vector<uint32_t>* shortest = &postings[e.items[0]];
        for (ItemCode x : e.items)
            if (postings[x].size() < shortest->size()) shortest = &postings[x];
        for (uint32_t id : *shortest) {
            const Entry& y = entries[id];
            if (y.alive && is_subset(e, y)) return false;
        }
    }

    uint32_t fresh = (uint32_t)entries.size();
    entries.push_back(std::move(e));
    ++live;
    const Entry& added = entries[fresh];

    // 2. Retire retained subsets: an entry is inside `added` exactly when
    //    every one of its items is hit while walking added's posting lists.
    if (!added.items.empty()) {
        for (uint32_t id : empty_sets)
            if (entries[id].alive) evict(id);
        empty_sets.clear();

        hits.resize(entries.size(), 0);
        std::vector<uint32_t> touched;
        for (ItemCode x : added.items) {
            for (uint32_t id : postings[x]) {
                if (!entries[id].alive) continue;
                if (hits[id]++ == 0) touched.push_back(id);
            }
        }
        for (uint32_t id : touched) {
            if (hits[id] == entries[id].items.size()) evict(id);
            hits[id] = 0;
        }

        for (ItemCode x : added.items) postings[x].push_back(fresh);
    } else {
        empty_sets.push_back(fresh);
    }

    if (dead > live && dead > 1024) compact();
    return true;
}

void ClosureIndex::compact() {
    for (auto& list : postings) {
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [&](uint32_t id) { return !entries[id].alive; }),
                   list.end());
    }
    dead = 0;
}

std::vector<CodedItemset> ClosureIndex::survivors() const {
    std::vector<CodedItemset> out;

    if (mode_ != ClosureMode::Generators) {
        out.reserve(live);
        for (const auto& e : entries)
            if (e.alive) out.push_back({e.items, e.support});
        return out;
    }

    // A generator has no immediate subset of the same support
    std::vector<ItemCode> sub;
    for (const auto& e : entries) {
        bool generator = true;
        for (size_t i = 0; i < e.items.size() && generator; ++i) {
            sub.assign(e.items.begin(), e.items.end());
            sub.erase(sub.begin() + i);
            auto it = lookup.find(sub);
            if (it == lookup.end())
                throw MissingSupportDataError("No support retained for " + describe(sub) +
                                              ", an immediate subset of " + describe(e.items));
            if (same_support(entries[it->second].support, e.support)) generator = false;
        }
        if (generator) out.push_back({e.items, e.support});
    }
    return out;
}
