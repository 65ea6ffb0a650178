#include "transaction_reader.h"
#include "errors.h"
#include <fstream>
#include <stdexcept>

namespace {

bool is_separator(char c, char delimiter) {
    if (delimiter == '\0') return c == ' ' || c == '\t';
    return c == delimiter;
}

void finish_line(std::vector<std::string>& fields, size_t line_no,
                 const ReaderOptions& options, std::vector<RawTransaction>& out) {
    if (fields.empty()) return;

    RawTransaction t;
    if (options.weighted) {
        const std::string& last = fields.back();
        size_t used = 0;
        try {
            t.weight = std::stod(last, &used);
        } catch (const std::logic_error&) {
            used = 0;
        }
        if (used == 0 || used != last.size())
            throw InvalidInputError("Line " + std::to_string(line_no) + ": bad weight '" + last + "'");
        fields.pop_back();
    }
    t.items = std::move(fields);
    out.push_back(std::move(t));
    fields.clear();
}

} // namespace

std::vector<RawTransaction> parse_transactions(std::istream& in, const ReaderOptions& options) {
    std::vector<RawTransaction> out;
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;
    bool quoted = false;     // current field had quotes, keep it even if empty
    size_t line_no = 1;
    char c;

    auto end_field = [&]() {
        if (!field.empty() || quoted) fields.push_back(std::move(field));
        field.clear();
        quoted = false;
    };

    while (in.get(c)) {
        if (in_quotes) {
            if (c == '"') {
                if (in.peek() == '"') {
                    field += '"';
                    in.get();
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') ++line_no;
                field += c;
            }
        } else if (c == '"') {
            in_quotes = true;
            quoted = true;
        } else if (c == '\n' || c == '\r') {
            end_field();
            finish_line(fields, line_no, options, out);
            if (c == '\r' && in.peek() == '\n') in.get();
            ++line_no;
        } else if (is_separator(c, options.delimiter)) {
            end_field();
        } else {
            field += c;
        }
    }
    end_field();
    finish_line(fields, line_no, options, out);
    return out;
}

std::vector<RawTransaction> read_transactions(const std::string& path, const ReaderOptions& options) {
    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw InvalidInputError("Could not open transaction file: " + path);
    return parse_transactions(file, options);
}
