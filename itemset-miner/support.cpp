#include "support.h"
#include "errors.h"
#include <algorithm>
#include <cfloat>
#include <cmath>
#include <limits>
#include <string>

Support weight_to_support(double weight) {
    if (!std::isfinite(weight) || weight <= 0.0)
        throw InvalidInputError("Transaction weight must be positive and finite, got " +
                                std::to_string(weight));
    return weight;
}

Support checked_add(Support a, Support b) {
    Support r = a + b;
    if (!std::isfinite(r))
        throw ArithmeticOverflowError("Support counter overflow");
    return r;
}

bool same_support(Support a, Support b) {
    return std::fabs(a - b) <= kSupportEpsilon * std::max(std::fabs(a), std::fabs(b));
}

Support resolve_threshold(double value, Support total) {
    double s = (value < 0) ? -value : (value / 100.0) * total * (1 - DBL_EPSILON);
    s *= 1 - kSupportEpsilon;
    // an itemset must occur at least once to be reported
    return std::max(s, std::numeric_limits<Support>::denorm_min());
}

Support resolve_upper_limit(double value, Support total) {
    double s = (value < 0) ? -value : (value / 100.0) * total * (1 + DBL_EPSILON);
    return s * (1 + kSupportEpsilon);
}
