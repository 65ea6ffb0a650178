#include "pattern_reporter.h"
#include "errors.h"

PatternReporter::PatternReporter(const ItemEncoder& encoder, Support total_weight,
                                 ReportOptions options, PatternCallback consumer)
    : encoder(encoder), total(total_weight), options(std::move(options)),
      consumer(std::move(consumer)) {
    validate_values(this->options.values);
}

void PatternReporter::validate_values(const std::string& values) {
    for (char c : values) {
        if (c != 'a' && c != 's' && c != 'S' && c != 'Q')
            throw InvalidConfigError(std::string("Unknown report value code: '") + c + "'");
    }
}

bool PatternReporter::report(const std::vector<ItemCode>& items, Support support) {
    if (stopped) return false;
    if (items.size() < options.zmin || items.size() > options.zmax) return true;
    if (support > options.max_support) return true;

    Pattern p;
    p.items = encoder.decode(items);
    p.support = support;
    double relative = total > 0 ? support / total : 0.0;
    for (char c : options.values) {
        switch (c) {
            case 'a': p.extra.push_back(p.support); break;
            case 's': p.extra.push_back(relative); break;
            case 'S': p.extra.push_back(100.0 * relative); break;
            case 'Q': p.extra.push_back(total); break;
        }
    }

    ++count;
    if (!consumer(std::move(p))) stopped = true;
    if (options.max_results != 0 && count >= options.max_results) stopped = true;
    return !stopped;
}
