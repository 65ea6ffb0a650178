#include "item_encoder.h"
#include "errors.h"
#include "support.h"
#include <algorithm>
#include <numeric>

TransactionDatabase ItemEncoder::encode(const std::vector<RawTransaction>& input) {
    if (input.empty())
        throw InvalidInputError("Transaction database is empty");

    code_to_item.clear();
    item_to_code.clear();

    // Phase I: provisional ids in first-appearance order, weighted frequencies
    std::vector<Item> first_seen;
    std::unordered_map<Item, uint32_t> provisional;
    std::vector<Support> freq;
    std::vector<uint32_t> last_row;   // counts an item once per transaction
    std::vector<std::vector<uint32_t>> rows(input.size());
    std::vector<Support> weights(input.size());

    for (size_t i = 0; i < input.size(); ++i) {
        const auto& raw = input[i];
        weights[i] = weight_to_support(raw.weight);
        rows[i].reserve(raw.items.size());

        for (const auto& item : raw.items) {
            if (item.empty())
                throw InvalidInputError("Empty item in transaction " + std::to_string(i));

            uint32_t id;
            auto it = provisional.find(item);
            if (it == provisional.end()) {
                id = (uint32_t)first_seen.size();
                provisional.emplace(item, id);
                first_seen.push_back(item);
                freq.push_back(0);
                last_row.push_back(0);
            } else {
                id = it->second;
            }

            if (last_row[id] != (uint32_t)i + 1) {
                freq[id] = checked_add(freq[id], weights[i]);
                last_row[id] = (uint32_t)i + 1;
                rows[i].push_back(id);
            }
        }
    }

    // Phase II: final codes by descending frequency, stable on ties
    std::vector<uint32_t> order(first_seen.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](uint32_t a, uint32_t b) { return freq[a] > freq[b]; });

    std::vector<ItemCode> recode(first_seen.size());
    code_to_item.reserve(order.size());
    for (uint32_t id : order) {
        if (freq[id] <= 0) continue;
        recode[id] = (ItemCode)code_to_item.size();
        item_to_code.emplace(first_seen[id], recode[id]);
        code_to_item.push_back(first_seen[id]);
    }

    std::vector<Transaction> encoded(input.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        encoded[i].weight = weights[i];
        encoded[i].items.reserve(rows[i].size());
        for (uint32_t id : rows[i]) encoded[i].items.push_back(recode[id]);
    }

    return TransactionDatabase(code_to_item.size(), std::move(encoded));
}

const Item& ItemEncoder::decode(ItemCode code) const {
    if (code >= code_to_item.size())
        throw InvalidInputError("Unknown item code " + std::to_string(code));
    return code_to_item[code];
}

std::vector<Item> ItemEncoder::decode(const std::vector<ItemCode>& codes) const {
    std::vector<Item> out;
    out.reserve(codes.size());
    for (ItemCode c : codes) out.push_back(decode(c));
    return out;
}

ItemCode ItemEncoder::code_of(const Item& item) const {
    auto it = item_to_code.find(item);
    if (it == item_to_code.end())
        throw InvalidInputError("Unknown item: " + item);
    return it->second;
}
