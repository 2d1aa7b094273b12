#pragma once

#include <ort/value.h>
#include <string>

namespace ort {

// Parse an ORT document into a Value. Throws ort::ParseError (with line
// number, column where known, and the raw source line) on malformed input.
// When `verbose` is true every recognized section is reported on stderr.
Value parse(const std::string& text, bool verbose = false);

// Serialize a Value to canonical ORT text. Arrays of objects sharing one key
// set are written as tables, everything else in literal form.
std::string generate(const Value& value);

}  // namespace ort
