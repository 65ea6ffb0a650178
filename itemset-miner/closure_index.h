#ifndef CLOSURE_INDEX_H
#define CLOSURE_INDEX_H

#include <cstdint>
#include <map>
#include <unordered_map>
#include <vector>
#include "types.h"

enum class ClosureMode {
    Closed,       // no strict superset of equal support
    Maximal,      // no strict superset at all
    Generators,   // no immediate subset of equal support
};

// Repository of accepted itemsets answering "is this a non-closed /
// non-maximal subset of something already found". Search strategies emit in
// no particular order, so a newly accepted itemset may also retire entries
// retained earlier; the final answer is survivors(), not the individual
// accept() results.
//
// Single-threaded; one instance per mining call.
class ClosureIndex {
private:
    struct Entry {
        std::vector<ItemCode> items;   // ascending
        Support support;
        uint64_t signature;            // bit (code % 64) per item
        bool alive;
    };

    ClosureMode mode_;
    std::vector<Entry> entries;                                  // acceptance order
    std::map<Support, std::vector<uint32_t>> buckets;            // closed: by support
    std::vector<std::vector<uint32_t>> postings;                 // maximal: by item
    std::vector<uint32_t> empty_sets;                            // maximal: the empty itemset
    std::unordered_map<std::vector<ItemCode>, uint32_t, VectorHasher> lookup;  // generators
    std::vector<uint32_t> hits;
    size_t live = 0;
    size_t dead = 0;

    static uint64_t signature_of(const std::vector<ItemCode>& items);
    static bool is_subset(const Entry& sub, const Entry& sup);

    std::vector<uint32_t>& bucket_for(Support support);

    bool accept_closed(Entry& e);
    bool accept_maximal(Entry& e);
    void evict(uint32_t id);
    void compact();

public:
    explicit ClosureIndex(ClosureMode mode);

    // Offers an itemset (items in any order). Returns whether it is retained
    // at this point. An itemset rejected here never becomes a survivor.
    bool accept(const std::vector<ItemCode>& items, Support support);

    // The filtered itemsets, in acceptance order. In generators mode throws
    // MissingSupportDataError when an immediate subset of an accepted itemset
    // was never accepted.
    std::vector<CodedItemset> survivors() const;

    // Number of retained itemsets
    size_t size() const { return live; }
};

#endif // CLOSURE_INDEX_H
