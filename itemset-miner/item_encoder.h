#ifndef ITEM_ENCODER_H
#define ITEM_ENCODER_H

#include <string>
#include <unordered_map>
#include <vector>
#include "types.h"
#include "transaction_database.h"

// Maps caller items to dense codes ordered by descending weighted frequency
// (ties keep first-appearance order) and back.
class ItemEncoder {
private:
    std::vector<Item> code_to_item;
    std::unordered_map<Item, ItemCode> item_to_code;

public:
    // Builds the dictionary and returns the encoded database. Throws
    // InvalidInputError on an empty input, an empty item or a bad weight.
    TransactionDatabase encode(const std::vector<RawTransaction>& input);

    size_t item_count() const { return code_to_item.size(); }
    const std::vector<Item>& items() const { return code_to_item; }

    const Item& decode(ItemCode code) const;
    std::vector<Item> decode(const std::vector<ItemCode>& codes) const;

    // Throws InvalidInputError for an item that never occurred
    ItemCode code_of(const Item& item) const;
};

#endif // ITEM_ENCODER_H
