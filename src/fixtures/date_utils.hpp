#pragma once

#include "pipeline/pipeline_errors.hpp"

#include <cctype>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// Calendar dates as YYYYMMDD integers. Integer order is chronological order.
// ---------------------------------------------------------------------------
namespace date_utils {

constexpr bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

constexpr int days_in_month(int y, int m) {
    constexpr int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap_year(y)) return 29;
    return DAYS[m - 1];
}

constexpr bool is_valid_date(int y, int m, int d) {
    if (y < 1 || y > 9999) return false;
    if (m < 1 || m > 12) return false;
    return d >= 1 && d <= days_in_month(y, m);
}

constexpr int to_yyyymmdd(int y, int m, int d) {
    return y * 10000 + m * 100 + d;
}

inline std::string format_date(int date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", date / 10000, (date / 100) % 100, date % 100);
    return buf;
}

namespace detail {

inline bool read_digits(const std::string& s, size_t pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int v = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

// Accepts HH:MM or HH:MM:SS starting at pos, running to the end of s.
inline bool valid_time_suffix(const std::string& s, size_t pos) {
    int hh = 0, mm = 0, ss = 0;
    if (!read_digits(s, pos, 2, hh) || pos + 2 >= s.size() || s[pos + 2] != ':') return false;
    if (!read_digits(s, pos + 3, 2, mm)) return false;
    size_t end = pos + 5;
    if (end < s.size()) {
        if (s[end] != ':' || !read_digits(s, end + 1, 2, ss)) return false;
        end += 3;
    }
    return end == s.size() && hh < 24 && mm < 60 && ss < 60;
}

inline std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

}  // namespace detail

// Parse "YYYY-MM-DD" or "YYYY/MM/DD", optionally followed by a time part
// ("THH:MM[:SS]" or " HH:MM[:SS]") which is discarded. Throws MalformedDate.
inline int parse_match_date(const std::string& text) {
    const std::string s = detail::trim(text);
    int y = 0, m = 0, d = 0;
    bool ok = s.size() >= 10 &&
              detail::read_digits(s, 0, 4, y) &&
              (s[4] == '-' || s[4] == '/') && s[7] == s[4] &&
              detail::read_digits(s, 5, 2, m) &&
              detail::read_digits(s, 8, 2, d);
    if (ok && s.size() > 10) {
        ok = (s[10] == 'T' || s[10] == ' ') && detail::valid_time_suffix(s, 11);
    }
    if (!ok || !is_valid_date(y, m, d)) {
        throw MalformedDate(text);
    }
    return to_yyyymmdd(y, m, d);
}

}  // namespace date_utils
