#ifndef LAPBENCH_DURATION_PARSE_HPP
#define LAPBENCH_DURATION_PARSE_HPP

#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

#include "lapbench/clock.hpp"

namespace lapbench {

// Parse duration strings like: 250ns, 1.5us, 2ms, 1s, 800 (nanoseconds).
// Intended for CLI inputs (not a general-purpose parser).
inline Duration parse_duration(const std::string& text) {
    auto trim = [](const std::string& s) -> std::string {
        std::size_t a = 0;
        while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
        std::size_t b = s.size();
        while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
        return s.substr(a, b - a);
    };

    const std::string s = trim(text);
    if (s.empty()) throw std::invalid_argument("empty duration string");

    // Numeric prefix: digits with at most one dot.
    std::size_t i = 0;
    bool seen_dot = false;
    while (i < s.size()) {
        const char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            ++i;
        } else if (c == '.' && !seen_dot) {
            seen_dot = true;
            ++i;
        } else {
            break;
        }
    }

    if (i == 0 || (i == 1 && seen_dot)) throw std::invalid_argument("duration has no numeric prefix: " + s);

    const double value = std::stod(s.substr(0, i));
    std::string unit = trim(s.substr(i));
    for (char& c : unit) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    double mult = 1.0;
    if (unit.empty() || unit == "ns") {
        mult = 1.0;
    } else if (unit == "us" || unit == "\xc2\xb5s") {
        mult = 1e3;
    } else if (unit == "ms") {
        mult = 1e6;
    } else if (unit == "s") {
        mult = 1e9;
    } else {
        throw std::invalid_argument("unsupported duration unit: " + unit);
    }

    const double ns = value * mult;
    if (ns > 9.2e18) throw std::overflow_error("duration overflows nanoseconds: " + s);

    return Duration(static_cast<Duration::rep>(std::llround(ns)));
}

} // namespace lapbench

#endif // LAPBENCH_DURATION_PARSE_HPP
