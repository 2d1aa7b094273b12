#include <ort/lexer.h>

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <system_error>

namespace ort {

std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '(':
            case ')':
            case '[':
            case ']':
            case ',':
            case '\\':
                result.push_back('\\');
                result.push_back(c);
                break;
            case '\n':
                result += "\\n";
                break;
            case '\t':
                result += "\\t";
                break;
            case '\r':
                result += "\\r";
                break;
            default:
                result.push_back(c);
                break;
        }
    }
    return result;
}

std::string unescape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool escaped = false;
    for (char c : s) {
        if (escaped) {
            if (c == 'n')
                out.push_back('\n');
            else if (c == 't')
                out.push_back('\t');
            else if (c == 'r')
                out.push_back('\r');
            else
                out.push_back(c);
            escaped = false;
        } else if (c == '\\') {
            escaped = true;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::vector<std::string> split_values(const std::string& s) {
    std::vector<std::string> values;
    std::string current;
    bool escaped = false;
    int paren_depth = 0;
    int bracket_depth = 0;

    for (char c : s) {
        if (escaped) {
            current.push_back(c);
            escaped = false;
            continue;
        }
        switch (c) {
            case '\\':
                escaped = true;
                current.push_back(c);
                break;
            case '(':
                ++paren_depth;
                current.push_back(c);
                break;
            case ')':
                --paren_depth;
                current.push_back(c);
                break;
            case '[':
                ++bracket_depth;
                current.push_back(c);
                break;
            case ']':
                --bracket_depth;
                current.push_back(c);
                break;
            case ',':
                if (paren_depth == 0 and bracket_depth == 0) {
                    values.push_back(std::move(current));
                    current.clear();
                } else {
                    current.push_back(c);
                }
                break;
            default:
                current.push_back(c);
                break;
        }
    }
    values.push_back(std::move(current));
    return values;
}

std::optional<double> parse_number(const std::string& s) {
    size_t i = 0;
    const size_t n = s.size();
    auto digit = [&](size_t k) { return k < n and std::isdigit(static_cast<unsigned char>(s[k])); };

    if (i < n and (s[i] == '+' or s[i] == '-')) ++i;
    size_t int_digits = 0;
    while (digit(i)) {
        ++i;
        ++int_digits;
    }
    size_t frac_digits = 0;
    if (i < n and s[i] == '.') {
        ++i;
        while (digit(i)) {
            ++i;
            ++frac_digits;
        }
    }
    if (int_digits + frac_digits == 0) return std::nullopt;
    if (i < n and (s[i] == 'e' or s[i] == 'E')) {
        ++i;
        if (i < n and (s[i] == '+' or s[i] == '-')) ++i;
        if (not digit(i)) return std::nullopt;
        while (digit(i)) ++i;
    }
    if (i != n) return std::nullopt;

    // from_chars rejects a leading '+'
    size_t start = (s[0] == '+') ? 1 : 0;
    double d = 0.0;
    auto res = std::from_chars(s.data() + start, s.data() + n, d);
    if (res.ec == std::errc::result_out_of_range) {
        return s[0] == '-' ? -HUGE_VAL : HUGE_VAL;
    }
    if (res.ec != std::errc() or res.ptr != s.data() + n) return std::nullopt;
    return d;
}

std::string format_number(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";
    if (d == std::floor(d) and std::fabs(d) < 1e15) {
        return std::to_string(static_cast<int64_t>(d));
    }
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), d);
    return std::string(buf, res.ptr);
}

std::string trim(const std::string& s) {
    size_t a = 0;
    while (a < s.size() and std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    size_t b = s.size();
    while (b > a and std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

}  // namespace ort
