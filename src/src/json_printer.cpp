#include <ort/json.h>
#include <ort/lexer.h>

#include <cmath>
#include <cstdio>
#include <sstream>

namespace ort {

namespace {
    std::string escape_json_string(const std::string& s) {
        std::string result;
        result.reserve(s.size() + 2);
        result.push_back('"');
        for (char c : s) {
            switch (c) {
                case '"':
                    result += "\\\"";
                    break;
                case '\\':
                    result += "\\\\";
                    break;
                case '\n':
                    result += "\\n";
                    break;
                case '\r':
                    result += "\\r";
                    break;
                case '\t':
                    result += "\\t";
                    break;
                case '\b':
                    result += "\\b";
                    break;
                case '\f':
                    result += "\\f";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                        result += buf;
                    } else {
                        result.push_back(c);
                    }
                    break;
            }
        }
        result.push_back('"');
        return result;
    }

    std::string number_text(double d) {
        if (not std::isfinite(d)) return "null";
        return format_number(d);
    }

    struct Printer {
        std::ostringstream out;
        int indent;

        explicit Printer(int n) : indent(n) {}

        void newline(int level) {
            if (indent == 0) return;
            out << '\n' << std::string(static_cast<size_t>(level * indent), ' ');
        }

        void value(const Value& v, int level) {
            switch (v.type()) {
                case Value::TYPE::Null:
                    out << "null";
                    return;
                case Value::TYPE::Bool:
                    out << (*v.asBool() ? "true" : "false");
                    return;
                case Value::TYPE::Number:
                    out << number_text(*v.asNumber());
                    return;
                case Value::TYPE::String:
                    out << escape_json_string(*v.asString());
                    return;
                case Value::TYPE::Array: {
                    const auto& arr = v.elements();
                    if (arr.empty()) {
                        out << "[]";
                        return;
                    }
                    out << '[';
                    for (size_t i = 0; i < arr.size(); ++i) {
                        if (i) out << ',';
                        newline(level + 1);
                        value(arr[i], level + 1);
                    }
                    newline(level);
                    out << ']';
                    return;
                }
                case Value::TYPE::Object: {
                    const auto& items = v.items();
                    if (items.empty()) {
                        out << "{}";
                        return;
                    }
                    out << '{';
                    for (size_t i = 0; i < items.size(); ++i) {
                        if (i) out << ',';
                        newline(level + 1);
                        out << escape_json_string(items[i].first) << (indent ? ": " : ":");
                        value(items[i].second, level + 1);
                    }
                    newline(level);
                    out << '}';
                    return;
                }
            }
        }
    };
}  // namespace

std::string dump_json(const Value& value, int indent) {
    Printer p(indent < 0 ? 0 : indent);
    p.value(value, 0);
    return p.out.str();
}

}  // namespace ort
