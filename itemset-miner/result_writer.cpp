#include "result_writer.h"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace {

void write_itemset(std::ostream& out, const std::vector<Item>& items) {
    out << "\"";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out << " ";
        for (char c : items[i]) {
            if (c == '"') out << "\"\"";
            else out << c;
        }
    }
    out << "\"";
}

const char* value_name(char code) {
    switch (code) {
        case 'a': return "abs_support";
        case 's': return "rel_support";
        case 'S': return "pct_support";
        case 'Q': return "total";
    }
    return "value";
}

// Restores the caller's precision on scope exit
class FullPrecision {
    std::ostream& out;
    std::streamsize saved;

public:
    explicit FullPrecision(std::ostream& out)
        : out(out), saved(out.precision(std::numeric_limits<double>::max_digits10)) {}
    ~FullPrecision() { out.precision(saved); }
};

std::ofstream open_output(const std::string& path) {
    std::ofstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Could not open output file: " + path);
    std::cout << "[LOG] Saving to " << path << std::endl;
    return f;
}

} // namespace

void write_patterns(std::ostream& out, const std::vector<Pattern>& patterns, const std::string& values) {
    FullPrecision guard(out);
    out << "itemset,support,length";
    for (char c : values) out << "," << value_name(c);
    out << "\n";

    for (const auto& p : patterns) {
        write_itemset(out, p.items);
        out << "," << p.support << "," << p.items.size();
        for (double v : p.extra) out << "," << v;
        out << "\n";
    }
}

void write_rules(std::ostream& out, const std::vector<Rule>& rules) {
    FullPrecision guard(out);
    out << "antecedent,consequent,support,confidence,lift\n";
    for (const auto& r : rules) {
        write_itemset(out, r.antecedent);
        out << ",";
        write_itemset(out, r.consequent);
        out << "," << r.support << "," << r.confidence << "," << r.lift;
        for (double v : r.measures) out << "," << v;
        out << "\n";
    }
}

void save_patterns_csv(const std::vector<Pattern>& patterns, const std::string& values, const std::string& path) {
    std::ofstream f = open_output(path);
    write_patterns(f, patterns, values);
}

void save_rules_csv(const std::vector<Rule>& rules, const std::string& path) {
    std::ofstream f = open_output(path);
    write_rules(f, rules);
}
