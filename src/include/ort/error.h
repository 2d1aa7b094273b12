#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace ort {

// Raised by the ORT and JSON parsers. `line` and `column` are 1-based;
// `column` is 0 when the error is not tied to a single character. `code`
// holds the raw (untrimmed) source line so editors can jump to the fault.
struct ParseError : public std::runtime_error {
    size_t line, column;
    std::string code;
    std::string message;

    ParseError(size_t l, std::string src, const std::string& msg, size_t c = 0)
        : std::runtime_error(format(l, src, msg)),
          line(l),
          column(c),
          code(std::move(src)),
          message(msg) {}

    // Used by the JSON bridge, which builds its own caret excerpt.
    ParseError(const std::string& what, size_t l, size_t c, std::string src)
        : std::runtime_error(what), line(l), column(c), code(std::move(src)), message(what) {}

  private:
    static std::string format(size_t l, const std::string& src, const std::string& msg) {
        return "Line " + std::to_string(l) + ": " + msg + "\n  " + src;
    }
};

struct TypeError : public std::logic_error {
    using std::logic_error::logic_error;
};

struct KeyError : public std::out_of_range {
    using std::out_of_range::out_of_range;
};

struct IndexError : public std::out_of_range {
    using std::out_of_range::out_of_range;
};

}  // namespace ort
