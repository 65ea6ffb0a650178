#ifndef RESULT_WRITER_H
#define RESULT_WRITER_H

#include <ostream>
#include <string>
#include <vector>
#include "types.h"

// CSV output, one record per line; itemsets are written as a single quoted
// field with the items separated by blanks.
void write_patterns(std::ostream& out, const std::vector<Pattern>& patterns, const std::string& values);
void write_rules(std::ostream& out, const std::vector<Rule>& rules);

void save_patterns_csv(const std::vector<Pattern>& patterns, const std::string& values, const std::string& path);
void save_rules_csv(const std::vector<Rule>& rules, const std::string& path);

#endif // RESULT_WRITER_H
