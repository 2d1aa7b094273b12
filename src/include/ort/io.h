#pragma once

#include <ort/value.h>
#include <string>

namespace ort {

// Read and parse an ORT file. Throws std::runtime_error when the file
// cannot be opened and ort::ParseError when its content is malformed.
Value load(const std::string& path, bool verbose = false);

// Generate ORT text for `value` and write it to `path`, replacing the file.
void dump(const Value& value, const std::string& path);

// Whole-file helpers shared with the command-line tool.
std::string read_file(const std::string& path);
void write_file(const std::string& path, const std::string& content);

}  // namespace ort
