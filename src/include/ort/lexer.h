#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ort {

// Backslash-escapes ( ) [ ] , and backslash; newline, tab and carriage return
// become \n, \t and \r.
std::string escape(const std::string& s);

// Inverse of escape(): \n, \t, \r map to control characters and any other
// escaped character stands for itself. A lone trailing backslash is dropped.
std::string unescape(const std::string& s);

// Splits on commas that are outside every (...) and [...] group. A backslash
// escapes the next character, which then never affects depth or splitting;
// the backslash itself is kept in the piece. Always returns at least one
// piece.
std::vector<std::string> split_values(const std::string& s);

// Accepts optional sign, digits with an optional fraction and an optional
// exponent. The whole text must match.
std::optional<double> parse_number(const std::string& s);

// Shortest decimal text that reads back to the same double; integral values
// print without a fractional part.
std::string format_number(double d);

// Whitespace trim shared by the parser and the CLI.
std::string trim(const std::string& s);

}  // namespace ort
