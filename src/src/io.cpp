#include <ort/io.h>
#include <ort/ort.h>

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace ort {

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (not in) throw std::runtime_error("cannot open file: " + path);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (not out) throw std::runtime_error("cannot open file: " + path);
    out << content;
    if (not out) throw std::runtime_error("failed writing file: " + path);
}

Value load(const std::string& path, bool verbose) { return parse(read_file(path), verbose); }

void dump(const Value& value, const std::string& path) {
    std::string text = generate(value);
    if (text.empty() or text.back() != '\n') text.push_back('\n');
    write_file(path, text);
}

}  // namespace ort
