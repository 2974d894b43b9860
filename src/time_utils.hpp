#pragma once

#include <cctype>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// Calendar helpers. Dates are carried as YYYYMMDD integers throughout.
// ---------------------------------------------------------------------------
namespace time_utils {

constexpr int INVALID_DATE = -1;

inline int make_date(int year, int month, int day) {
    return year * 10000 + month * 100 + day;
}

inline int year_of(int date) { return date / 10000; }

inline int year_start(int year) { return make_date(year, 1, 1); }
inline int year_end(int year) { return make_date(year, 12, 31); }

// Parse the leading "YYYY-MM-DD" (or "YYYYMMDD") of an ISO-like timestamp.
// Anything after the date part (time of day, zone) is ignored.
inline int parse_date(const std::string& ts) {
    int digits[8];
    int n = 0;
    for (char c : ts) {
        if (n == 8) break;
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits[n++] = c - '0';
        } else if (c == '-' || c == '/') {
            if (n != 4 && n != 6) return INVALID_DATE;
        } else {
            break;
        }
    }
    if (n != 8) return INVALID_DATE;

    int year = digits[0] * 1000 + digits[1] * 100 + digits[2] * 10 + digits[3];
    int month = digits[4] * 10 + digits[5];
    int day = digits[6] * 10 + digits[7];
    if (month < 1 || month > 12 || day < 1 || day > 31) return INVALID_DATE;
    return make_date(year, month, day);
}

// Seconds since midnight of the "HH:MM[:SS]" that follows the date part
// (separated by ' ' or 'T'); 0 for a bare date, -1 when malformed.
inline int parse_seconds_of_day(const std::string& ts) {
    size_t pos = 0;
    int n = 0;
    while (pos < ts.size() && n < 8) {
        if (std::isdigit(static_cast<unsigned char>(ts[pos]))) ++n;
        ++pos;
    }
    if (n != 8) return -1;
    if (pos == ts.size()) return 0;
    if (ts[pos] != ' ' && ts[pos] != 'T') return -1;
    ++pos;

    int fields[3] = {0, 0, 0};
    int count = 0;
    while (count < 3) {
        if (pos + 2 > ts.size() ||
            !std::isdigit(static_cast<unsigned char>(ts[pos])) ||
            !std::isdigit(static_cast<unsigned char>(ts[pos + 1]))) {
            return -1;
        }
        fields[count++] = (ts[pos] - '0') * 10 + (ts[pos + 1] - '0');
        pos += 2;
        if (pos < ts.size() && ts[pos] == ':') {
            ++pos;
        } else {
            break;
        }
    }
    if (count < 2) return -1;
    if (fields[0] > 23 || fields[1] > 59 || fields[2] > 59) return -1;
    return fields[0] * 3600 + fields[1] * 60 + fields[2];
}

constexpr long long INVALID_TIMESTAMP = -1;

// Sortable instant: YYYYMMDD * 100000 + seconds of day. "2021-01-04" and
// "2021-01-04 00:00:00" map to the same key.
inline long long timestamp_key(const std::string& ts) {
    int date = parse_date(ts);
    int seconds = parse_seconds_of_day(ts);
    if (date == INVALID_DATE || seconds < 0) return INVALID_TIMESTAMP;
    return static_cast<long long>(date) * 100000LL + seconds;
}

inline std::string date_to_string(int date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
                  date / 10000, (date / 100) % 100, date % 100);
    return buf;
}

}  // namespace time_utils
