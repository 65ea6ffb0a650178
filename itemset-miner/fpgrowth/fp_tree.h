#ifndef FP_TREE_H
#define FP_TREE_H

#include <cstdint>
#include <limits>
#include <vector>
#include "../types.h"

constexpr uint32_t kNoNode = std::numeric_limits<uint32_t>::max();

struct FPNode {
    ItemCode item;
    Support count;
    uint32_t parent;
    uint32_t first_child;
    uint32_t next_sibling;
    uint32_t link;          // next node carrying the same item
};

// Prefix tree over (filtered) transactions. Nodes live in one arena and are
// addressed by index; node 0 is the root.
class FPTree {
private:
    std::vector<FPNode> nodes;
    std::vector<uint32_t> heads;     // per item: first node of its link chain
    std::vector<Support> supports;   // per item: sum over its nodes

public:
    explicit FPTree(size_t item_count);

    // `items` must follow the tree order (ascending codes)
    void insert(const std::vector<ItemCode>& items, Support weight);

    bool empty() const { return nodes.size() <= 1; }
    size_t node_count() const { return nodes.size(); }
    size_t item_count() const { return heads.size(); }

    const FPNode& node(uint32_t index) const { return nodes[index]; }
    uint32_t head(ItemCode item) const { return heads[item]; }
    Support support(ItemCode item) const { return supports[item]; }
};

#endif // FP_TREE_H
