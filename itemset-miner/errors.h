#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

// Root of everything the miner throws on purpose
class MiningError : public std::runtime_error {
public:
    explicit MiningError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed transactions or items at encode time
class InvalidInputError : public MiningError {
public:
    explicit InvalidInputError(const std::string& what) : MiningError(what) {}
};

// Weight sum is no longer finite
class ArithmeticOverflowError : public MiningError {
public:
    explicit ArithmeticOverflowError(const std::string& what) : MiningError(what) {}
};

// Cancellation was requested and honored
class AbortedError : public MiningError {
public:
    explicit AbortedError(const std::string& what) : MiningError(what) {}
};

// An itemset needed for a later phase was not produced by the search
class MissingSupportDataError : public MiningError {
public:
    explicit MissingSupportDataError(const std::string& what) : MiningError(what) {}
};

// Rejected before any database scan
class InvalidConfigError : public MiningError {
public:
    explicit InvalidConfigError(const std::string& what) : MiningError(what) {}
};

#endif // ERRORS_H
