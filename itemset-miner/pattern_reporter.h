#ifndef PATTERN_REPORTER_H
#define PATTERN_REPORTER_H

#include <functional>
#include <limits>
#include <string>
#include <vector>
#include "types.h"
#include "item_encoder.h"

// Receives each reported pattern; returns false to stop the search
using PatternCallback = std::function<bool(Pattern&&)>;

struct ReportOptions {
    size_t zmin = 1;
    size_t zmax = std::numeric_limits<size_t>::max();
    Support max_support = std::numeric_limits<Support>::max();
    size_t max_results = 0;   // 0 = unlimited
    std::string values;       // extra value codes, see validate_values()
};

// Turns accepted (codes, support) pairs into caller-visible patterns in the
// order they arrive: size and max-support filters, result limit, decoding
// and the optional extra values.
class PatternReporter {
private:
    const ItemEncoder& encoder;
    Support total;
    ReportOptions options;
    PatternCallback consumer;
    size_t count = 0;
    bool stopped = false;

public:
    PatternReporter(const ItemEncoder& encoder, Support total_weight,
                    ReportOptions options, PatternCallback consumer);

    // Value codes: 'a' absolute support, 's' relative support (fraction),
    // 'S' relative support in percent, 'Q' total transaction weight.
    // Throws InvalidConfigError on any other character.
    static void validate_values(const std::string& values);

    // Returns false once no more patterns are wanted
    bool report(const std::vector<ItemCode>& items, Support support);

    bool full() const { return stopped; }
    size_t reported() const { return count; }
};

#endif // PATTERN_REPORTER_H
