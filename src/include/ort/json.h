#pragma once

#include <ort/value.h>
#include <string>

namespace ort {

// Strict JSON with // and /* */ comments allowed between tokens. Object key
// order is kept; a repeated key is an error.
Value parse_json(const std::string& text);

// Compact when indent is 0, otherwise one member per line with `indent`
// spaces per level. NaN and infinities are written as null.
std::string dump_json(const Value& value, int indent = 0);

namespace json_literals {
    inline Value operator"" _json(const char* s, std::size_t len) {
        return parse_json(std::string(s, len));
    }
}

}  // namespace ort
