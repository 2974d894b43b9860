#pragma once

#include "rules/rule.hpp"

#include <cctype>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// ParseError — why a condition token was rejected
// ---------------------------------------------------------------------------
struct ParseError {
    enum class Kind { NONE, MISSING_LAG_SUFFIX, EMPTY_ATTRIBUTE, BAD_LAG };

    Kind kind = Kind::NONE;
    std::string token;

    const char* describe() const {
        switch (kind) {
            case Kind::NONE:               return "ok";
            case Kind::MISSING_LAG_SUFFIX: return "expected <attr>(t-<lag>)";
            case Kind::EMPTY_ATTRIBUTE:    return "empty attribute name";
            case Kind::BAD_LAG:            return "lag is not a non-negative integer";
        }
        return "unknown";
    }
};

// ---------------------------------------------------------------------------
// ConditionParseResult — exactly one of {condition, error} is meaningful
// ---------------------------------------------------------------------------
struct ConditionParseResult {
    std::optional<Condition> condition;
    ParseError error;

    bool ok() const { return condition.has_value(); }
};

// Parse one rule-table cell of the form "<attribute>(t-<lag>)".
// The attribute is everything before the last complete "(t-<digits>)"; it
// may itself contain parentheses (e.g. "EURJPY_Up(1)(t-2)"). Text after the
// closing parenthesis is ignored ("A(t-1)x" reads as A at lag 1).
inline ConditionParseResult parse_condition(const std::string& raw) {
    ConditionParseResult result;
    std::string token = raw;
    while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back()))) token.pop_back();
    size_t first = 0;
    while (first < token.size() && std::isspace(static_cast<unsigned char>(token[first]))) ++first;
    token = token.substr(first);
    result.error.token = token;

    size_t open = token.rfind("(t-");
    if (open == std::string::npos) {
        result.error.kind = ParseError::Kind::MISSING_LAG_SUFFIX;
        return result;
    }

    // Walk "(t-" occurrences right to left; the error reported is the one
    // found at the rightmost occurrence.
    bool have_error = false;
    while (open != std::string::npos) {
        size_t digits_begin = open + 3;
        size_t close = digits_begin;
        while (close < token.size() && std::isdigit(static_cast<unsigned char>(token[close]))) {
            ++close;
        }
        ParseError::Kind kind = ParseError::Kind::NONE;
        if (close == digits_begin || close - digits_begin > 9) {
            kind = ParseError::Kind::BAD_LAG;
        } else if (close >= token.size() || token[close] != ')') {
            kind = (close < token.size()) ? ParseError::Kind::BAD_LAG
                                          : ParseError::Kind::MISSING_LAG_SUFFIX;
        } else if (open == 0) {
            kind = ParseError::Kind::EMPTY_ATTRIBUTE;
        }

        if (kind == ParseError::Kind::NONE) {
            int lag = 0;
            for (size_t i = digits_begin; i < close; ++i) lag = lag * 10 + (token[i] - '0');
            result.condition = Condition{token.substr(0, open), lag};
            result.error = ParseError{};
            result.error.token = token;
            return result;
        }
        if (!have_error) {
            result.error.kind = kind;
            have_error = true;
        }
        open = open == 0 ? std::string::npos : token.rfind("(t-", open - 1);
    }
    return result;
}

// A rule-table cell that marks "no further conditions": 0, empty or NaN.
inline bool is_absent_cell(const std::string& cell) {
    return cell.empty() || cell == "0" || cell == "0.0" ||
           cell == "nan" || cell == "NaN";
}
