#ifndef TYPES_H
#define TYPES_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using Item = std::string;
using ItemCode = uint32_t;

// Weighted support: sum of transaction weights (see support.h)
using Support = double;

struct RawTransaction {
    std::vector<Item> items;
    double weight = 1.0;
};

// Encoded transaction: distinct codes, ascending
struct Transaction {
    std::vector<ItemCode> items;
    Support weight = 0;
};

// A reported itemset: (items, support[, extra values])
struct Pattern {
    std::vector<Item> items;
    double support = 0.0;
    std::vector<double> extra;
};

// A reported rule: (antecedent, consequent, support, confidence[, lift, measures])
struct Rule {
    std::vector<Item> antecedent;
    std::vector<Item> consequent;
    double support = 0.0;
    double confidence = 0.0;
    double lift = 0.0;
    std::vector<double> measures;
};

// Itemset still in code space, as produced by the search and kept by the index
struct CodedItemset {
    std::vector<ItemCode> items;
    Support support = 0;
};

struct VectorHasher {
    size_t operator()(const std::vector<uint32_t>& v) const {
        size_t seed = v.size();
        for (auto x : v) seed ^= x + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        return seed;
    }
};

#endif // TYPES_H
