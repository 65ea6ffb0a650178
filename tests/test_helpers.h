#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "types.h"
#include "support.h"

namespace test_data {

using ItemsetKey = std::vector<std::string>;
// Supports in millionths, so that sums taken in another order compare equal
using SupportTable = std::map<ItemsetKey, int64_t>;

// Weighted example with a repeated transaction (1,2,3,4)
inline std::vector<RawTransaction> weighted_scenario() {
    return {
        {{"1", "2", "3"}, 0.5},
        {{"1", "4", "5"}, 1.2},
        {{"2", "3", "4"}, 0.8},
        {{"1", "2", "3", "4"}, 0.3},
        {{"2", "3"}, 1.5},
        {{"1", "2", "4"}, 0.9},
        {{"4", "5"}, 0.6},
        {{"1", "2", "3", "4"}, 1.0},
        {{"3", "4", "5"}, 0.7},
    };
}

// Deterministic pseudo-random database over `n_items` items
inline std::vector<RawTransaction> generated(size_t n_rows, size_t n_items, uint32_t seed) {
    static const double weights[] = {1.0, 0.5, 2.25, 1.0, 3.0};
    std::vector<RawTransaction> out;
    uint32_t state = seed;
    auto next = [&]() {
        state = state * 1664525u + 1013904223u;
        return state >> 8;
    };
    for (size_t r = 0; r < n_rows; ++r) {
        RawTransaction t;
        for (size_t i = 0; i < n_items; ++i) {
            // skewed item frequencies
            if (next() % (i + 2) == 0) t.items.push_back("i" + std::to_string(i));
        }
        if (t.items.empty()) t.items.push_back("i0");
        t.weight = weights[next() % 5];
        out.push_back(std::move(t));
    }
    return out;
}

inline int64_t units(double weight) {
    return std::llround(weight * 1e6);
}

// Absolute threshold of `weight`, resolved the way the miner does it
inline Support absolute(double weight) {
    return resolve_threshold(-weight, weight);
}

// Every itemset (empty one included) with its support, by enumeration
inline SupportTable brute_force(const std::vector<RawTransaction>& db, Support min_support) {
    std::set<std::string> universe_set;
    for (const auto& t : db) universe_set.insert(t.items.begin(), t.items.end());
    std::vector<std::string> universe(universe_set.begin(), universe_set.end());

    std::vector<std::set<std::string>> rows;
    for (const auto& t : db) rows.emplace_back(t.items.begin(), t.items.end());

    SupportTable table;
    for (uint64_t mask = 0; mask < (uint64_t(1) << universe.size()); ++mask) {
        ItemsetKey key;
        for (size_t i = 0; i < universe.size(); ++i)
            if (mask & (uint64_t(1) << i)) key.push_back(universe[i]);

        Support s = 0;
        for (size_t r = 0; r < rows.size(); ++r) {
            bool all = true;
            for (const auto& item : key)
                if (!rows[r].count(item)) { all = false; break; }
            if (all) s += weight_to_support(db[r].weight);
        }
        if (s >= min_support) table.emplace(key, units(s));
    }
    return table;
}

inline bool strict_subset(const ItemsetKey& a, const ItemsetKey& b) {
    return a.size() < b.size() && std::includes(b.begin(), b.end(), a.begin(), a.end());
}

inline SupportTable closed_of(const SupportTable& freq) {
    SupportTable out;
    for (const auto& x : freq) {
        bool closed = true;
        for (const auto& y : freq)
            if (y.second == x.second && strict_subset(x.first, y.first)) { closed = false; break; }
        if (closed) out.insert(x);
    }
    return out;
}

inline SupportTable maximal_of(const SupportTable& freq) {
    SupportTable out;
    for (const auto& x : freq) {
        bool maximal = true;
        for (const auto& y : freq)
            if (strict_subset(x.first, y.first)) { maximal = false; break; }
        if (maximal) out.insert(x);
    }
    return out;
}

inline SupportTable generators_of(const SupportTable& freq) {
    SupportTable out;
    for (const auto& x : freq) {
        bool generator = true;
        for (size_t i = 0; i < x.first.size() && generator; ++i) {
            ItemsetKey sub = x.first;
            sub.erase(sub.begin() + i);
            if (freq.at(sub) == x.second) generator = false;
        }
        if (generator) out.insert(x);
    }
    return out;
}

inline SupportTable sized(const SupportTable& table, size_t zmin, size_t zmax) {
    SupportTable out;
    for (const auto& x : table)
        if (x.first.size() >= zmin && x.first.size() <= zmax) out.insert(x);
    return out;
}

// Mining output in the oracle's shape; duplicate itemsets are kept apart
// by the multiset count so callers can detect them
inline SupportTable to_table(const std::vector<Pattern>& patterns, size_t* duplicates = nullptr) {
    SupportTable table;
    size_t dups = 0;
    for (const auto& p : patterns) {
        ItemsetKey key = p.items;
        std::sort(key.begin(), key.end());
        if (!table.emplace(key, units(p.support)).second) ++dups;
    }
    if (duplicates) *duplicates = dups;
    return table;
}

} // namespace test_data

#endif // TEST_HELPERS_H
