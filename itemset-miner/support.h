#ifndef SUPPORT_H
#define SUPPORT_H

#include "types.h"

// Relative slack for comparing weighted supports. Sums of the same weights
// taken in a different order may differ in the last bits.
constexpr double kSupportEpsilon = 1e-12;

// Validates a caller weight. Throws InvalidInputError for non-finite or
// non-positive weights.
Support weight_to_support(double weight);

// a + b, throwing ArithmeticOverflowError when the sum is no longer finite
Support checked_add(Support a, Support b);

// Whether two supports are equal up to summation order
bool same_support(Support a, Support b);

// Resolves a lower threshold given with the sign convention of the tools:
// negative = absolute weighted count, non-negative = percent of total.
// The result is slightly below the exact value so that the bound stays
// inclusive, and never below the smallest positive support.
Support resolve_threshold(double value, Support total);

// Same convention for an upper limit (max support); rounded up instead
Support resolve_upper_limit(double value, Support total);

#endif // SUPPORT_H
