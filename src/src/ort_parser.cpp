#include <ort/ort.h>
#include <ort/lexer.h>

#include <cctype>
#include <iostream>
#include <optional>
#include <vector>

namespace ort {

namespace {
    struct Field {
        std::string name;
        std::vector<Field> children;

        bool nested() const { return not children.empty(); }
    };

    struct Header {
        bool anonymous = false;
        std::string key;
        std::string fields;
        // column of fields[0] within the raw line, 0-based
        size_t fields_offset = 0;
    };

    bool skippable(const std::string& t) { return t.empty() or t[0] == '#'; }

    bool is_header(const std::string& t) {
        if (t.empty()) return false;
        if (t.front() == ':') return true;
        return t.back() == ':';
    }

    size_t leading_ws(const std::string& s) {
        size_t n = 0;
        while (n < s.size() and std::isspace(static_cast<unsigned char>(s[n]))) ++n;
        return n;
    }

    struct OrtParser {
        std::vector<std::string> lines;
        bool verbose = false;

        OrtParser(const std::string& text, bool v) : verbose(v) {
            size_t start = 0;
            while (start <= text.size()) {
                size_t nl = text.find('\n', start);
                if (nl == std::string::npos) nl = text.size();
                std::string line = text.substr(start, nl - start);
                if (not line.empty() and line.back() == '\r') line.pop_back();
                lines.push_back(std::move(line));
                start = nl + 1;
            }
        }

        ParseError error(size_t idx, const std::string& msg, size_t col = 0) const {
            return ParseError(idx + 1, lines[idx], msg, col);
        }

        std::string text_at(size_t idx) const { return trim(lines[idx]); }

        // Index of the next header line after `idx`, or lines.size().
        size_t section_end(size_t idx) const {
            size_t j = idx + 1;
            for (; j < lines.size(); ++j) {
                std::string t = text_at(j);
                if (not skippable(t) and is_header(t)) break;
            }
            return j;
        }

        std::optional<size_t> first_data_line(size_t begin, size_t end) const {
            for (size_t j = begin; j < end; ++j)
                if (not skippable(text_at(j))) return j;
            return std::nullopt;
        }

        size_t count_data_lines(size_t begin, size_t end) const {
            size_t n = 0;
            for (size_t j = begin; j < end; ++j)
                if (not skippable(text_at(j))) ++n;
            return n;
        }

        Header parse_header(size_t idx) const {
            const std::string& raw = lines[idx];
            size_t lead = leading_ws(raw);
            std::string t = trim(raw);
            Header h;
            if (t.front() == ':') {
                h.anonymous = true;
                h.fields = t.substr(1);
                h.fields_offset = lead + 1;
            } else {
                size_t colon = t.find(':');
                if (colon == std::string::npos) throw error(idx, "Invalid header format");
                h.key = trim(t.substr(0, colon));
                std::string rest = t.substr(colon + 1);
                h.fields_offset = lead + colon + 1 + leading_ws(rest);
                h.fields = rest.substr(leading_ws(rest));
            }
            if (not h.fields.empty() and h.fields.back() == ':') h.fields.pop_back();
            return h;
        }

        // `offset` is the 0-based column of text[0] in the raw line.
        std::vector<Field> parse_fields(const std::string& text, size_t idx, size_t offset) const {
            std::vector<Field> result;
            if (trim(text).empty()) return result;

            std::string current;
            int depth = 0;
            size_t i = 0;
            auto flush = [&]() {
                std::string name = trim(current);
                if (not name.empty()) result.push_back(Field{name, {}});
                current.clear();
            };

            while (i < text.size()) {
                char c = text[i];
                if (c == '(') {
                    // nested group: scan to the matching ')'
                    std::string name = trim(current);
                    current.clear();
                    size_t inner_start = ++i;
                    int nested_depth = 1;
                    while (i < text.size()) {
                        if (text[i] == '(')
                            ++nested_depth;
                        else if (text[i] == ')' and --nested_depth == 0)
                            break;
                        ++i;
                    }
                    std::string inner = text.substr(inner_start, i - inner_start);
                    result.push_back(Field{name, parse_fields(inner, idx, offset + inner_start)});
                    if (i < text.size()) ++i;  // past ')'
                    continue;
                }
                if (c == ')') {
                    if (--depth < 0)
                        throw error(idx, "Unmatched closing parenthesis", offset + i + 1);
                    current.push_back(c);
                } else if (c == ',' and depth == 0) {
                    flush();
                } else {
                    current.push_back(c);
                }
                ++i;
            }
            flush();
            return result;
        }

        Value parse_value(const std::string& s, size_t idx) const {
            std::string t = trim(s);
            if (t.empty()) return Value();
            if (t == "[]") return Value(Value::Array{});
            if (t == "()") return Value::object();
            if (t.front() == '[' and t.back() == ']') return parse_array(t.substr(1, t.size() - 2), idx);
            if (t.front() == '(' and t.back() == ')')
                return parse_inline_object(t.substr(1, t.size() - 2), idx);

            std::string u = unescape(t);
            if (auto n = parse_number(u)) return Value(*n);
            if (u == "true") return Value(true);
            if (u == "false") return Value(false);
            return Value(std::move(u));
        }

        Value parse_array(const std::string& inner, size_t idx) const {
            Value::Array out;
            if (trim(inner).empty()) return Value(std::move(out));
            auto parts = split_values(inner);
            out.reserve(parts.size());
            for (auto const& p : parts) out.push_back(parse_value(p, idx));
            return Value(std::move(out));
        }

        Value parse_inline_object(const std::string& inner, size_t idx) const {
            Value::Object items;
            if (trim(inner).empty()) return Value(std::move(items));
            for (auto const& pair : split_values(inner)) {
                size_t colon = pair.find(':');
                if (colon == std::string::npos) continue;
                items.emplace_back(trim(pair.substr(0, colon)), parse_value(pair.substr(colon + 1), idx));
            }
            return Value(std::move(items));
        }

        Value parse_field_value(const Field& field, const std::string& s, size_t idx) const {
            if (not field.nested()) return parse_value(s, idx);

            std::string t = trim(s);
            if (t.empty()) return Value();
            if (t == "()") return Value::object();
            // arrays and bare scalars in a tuple column fall back to the generic grammar
            if (t.front() != '(' or t.back() != ')') return parse_value(t, idx);

            auto parts = split_values(t.substr(1, t.size() - 2));
            if (parts.size() != field.children.size()) {
                throw error(idx, "Expected " + std::to_string(field.children.size()) +
                                         " nested values but got " + std::to_string(parts.size()));
            }
            return make_record(field.children, parts, idx);
        }

        Value make_record(const std::vector<Field>& fields, const std::vector<std::string>& parts,
                          size_t idx) const {
            Value::Object items;
            items.reserve(fields.size());
            for (size_t k = 0; k < fields.size(); ++k)
                items.emplace_back(fields[k].name, parse_field_value(fields[k], parts[k], idx));
            return Value(std::move(items));
        }

        Value::Array parse_rows(const std::vector<Field>& fields, size_t begin, size_t end) const {
            Value::Array rows;
            for (size_t j = begin; j < end; ++j) {
                std::string t = text_at(j);
                if (skippable(t)) continue;
                auto parts = split_values(t);
                if (parts.size() != fields.size()) {
                    throw error(j, "Expected " + std::to_string(fields.size()) + " values but got " +
                                           std::to_string(parts.size()));
                }
                rows.push_back(make_record(fields, parts, j));
            }
            return rows;
        }

        void report(size_t idx, const Header& h, size_t nfields, size_t begin, size_t end) const {
            if (not verbose) return;
            std::cerr << "ort: line " << (idx + 1) << ": ";
            if (h.anonymous)
                std::cerr << "anonymous section";
            else
                std::cerr << "section '" << h.key << "'";
            std::cerr << " (" << nfields << " fields, " << count_data_lines(begin, end)
                      << " data lines)\n";
        }

        // The first anonymous header decides the whole document.
        Value parse_anonymous(const Header& h, size_t idx, size_t end) const {
            std::string body = trim(h.fields);
            if (not body.empty() and body.front() == '[') {
                if (verbose) std::cerr << "ort: line " << (idx + 1) << ": anonymous literal\n";
                return parse_value(body, idx);
            }
            auto fields = parse_fields(h.fields, idx, h.fields_offset);
            report(idx, h, fields.size(), idx + 1, end);
            if (fields.empty()) {
                auto first = first_data_line(idx + 1, end);
                if (not first) return Value(Value::Array{});
                return parse_value(text_at(*first), *first);
            }
            Value::Array rows = parse_rows(fields, idx + 1, end);
            if (rows.size() == 1) return rows.front();
            return Value(std::move(rows));
        }

        Value parse_named(const Header& h, size_t idx, size_t end) const {
            auto fields = parse_fields(h.fields, idx, h.fields_offset);
            report(idx, h, fields.size(), idx + 1, end);
            if (fields.empty()) {
                // only the first data line of a `key:` section is read
                auto first = first_data_line(idx + 1, end);
                if (not first) return Value();
                return parse_value(text_at(*first), *first);
            }
            return Value(parse_rows(fields, idx + 1, end));
        }

        bool only_content_line(size_t idx) const {
            for (size_t j = 0; j < lines.size(); ++j)
                if (j != idx and not skippable(text_at(j))) return false;
            return true;
        }

        Value parse_document() const {
            Value::Object result;
            size_t idx = 0;
            while (idx < lines.size()) {
                std::string t = text_at(idx);
                if (skippable(t)) {
                    ++idx;
                    continue;
                }
                // a lone non-header line is a top-level scalar
                if (not is_header(t) and only_content_line(idx)) return parse_value(t, idx);
                if (t.find(':') == std::string::npos) throw error(idx, "Invalid header format");
                Header h = parse_header(idx);
                size_t end = section_end(idx);
                if (h.anonymous) return parse_anonymous(h, idx, end);
                result.emplace_back(h.key, parse_named(h, idx, end));
                idx = end;
            }
            return Value(std::move(result));
        }
    };
}  // namespace

Value parse(const std::string& text, bool verbose) {
    OrtParser p(text, verbose);
    return p.parse_document();
}

}  // namespace ort
