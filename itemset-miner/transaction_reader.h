#ifndef TRANSACTION_READER_H
#define TRANSACTION_READER_H

#include <istream>
#include <string>
#include <vector>
#include "types.h"

struct ReaderOptions {
    char delimiter = '\0';   // '\0' = any run of blanks and tabs
    bool weighted = false;   // last field of a line is the transaction weight
};

// One transaction per line, items separated by the delimiter. Fields may be
// quoted ("a b" is one item, "" inside quotes is a quote). Blank lines are
// skipped. Throws InvalidInputError on an unreadable file or a bad weight.
std::vector<RawTransaction> read_transactions(const std::string& path, const ReaderOptions& options);
std::vector<RawTransaction> parse_transactions(std::istream& in, const ReaderOptions& options);

#endif // TRANSACTION_READER_H
