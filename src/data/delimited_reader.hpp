#pragma once

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Minimal delimited-text reading shared by the rule table (TSV) and the
// time-series loader (CSV). No quoting: neither format uses it.
// ---------------------------------------------------------------------------
namespace delimited {

inline std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r' || s[b] == '\n')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r' || s[e - 1] == '\n')) --e;
    return s.substr(b, e - b);
}

// Split on `delim`, keeping empty fields (including a trailing one).
inline std::vector<std::string> split(const std::string& line, char delim) {
    std::vector<std::string> fields;
    std::string field;
    for (char c : line) {
        if (c == delim) {
            fields.push_back(trim(field));
            field.clear();
        } else {
            field += c;
        }
    }
    fields.push_back(trim(field));
    return fields;
}

inline std::optional<double> parse_double(const std::string& s) {
    if (s.empty()) return std::nullopt;
    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE) return std::nullopt;
    return v;
}

// ---------------------------------------------------------------------------
// Table — header + string rows, with column lookup by name
// ---------------------------------------------------------------------------
struct Table {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    int column(const std::string& name) const {
        for (size_t i = 0; i < header.size(); ++i) {
            if (header[i] == name) return static_cast<int>(i);
        }
        return -1;
    }

    bool has_column(const std::string& name) const { return column(name) >= 0; }
};

// Read a whole delimited file. Blank lines are skipped. Rows whose field
// count differs from the header are reported through `ragged_rows` (1-based
// line numbers) and left out of the table.
inline std::optional<Table> read_table(const std::string& path, char delim,
                                       std::vector<int>* ragged_rows = nullptr) {
    std::ifstream in(path);
    if (!in.is_open()) return std::nullopt;

    Table table;
    std::string line;
    int line_no = 0;
    bool have_header = false;
    while (std::getline(in, line)) {
        ++line_no;
        if (trim(line).empty()) continue;
        auto fields = split(line, delim);
        if (!have_header) {
            table.header = std::move(fields);
            have_header = true;
            continue;
        }
        if (fields.size() != table.header.size()) {
            if (ragged_rows) ragged_rows->push_back(line_no);
            continue;
        }
        table.rows.push_back(std::move(fields));
    }
    return table;
}

}  // namespace delimited
