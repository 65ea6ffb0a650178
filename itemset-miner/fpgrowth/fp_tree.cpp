#include "fp_tree.h"

FPTree::FPTree(size_t item_count) : heads(item_count, kNoNode), supports(item_count, 0) {
    nodes.push_back({0, 0, kNoNode, kNoNode, kNoNode, kNoNode});
}

void FPTree::insert(const std::vector<ItemCode>& items, Support weight) {
    uint32_t current = 0;
    for (ItemCode item : items) {
        uint32_t child = nodes[current].first_child;
        while (child != kNoNode && nodes[child].item != item)
            child = nodes[child].next_sibling;

        if (child == kNoNode) {
            child = (uint32_t)nodes.size();
            nodes.push_back({item, 0, current, kNoNode, nodes[current].first_child, heads[item]});
            nodes[current].first_child = child;
            heads[item] = child;
        }
        nodes[child].count += weight;
        supports[item] += weight;
        current = child;
    }
}
