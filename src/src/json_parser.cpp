#include <ort/json.h>
#include <ort/lexer.h>

#include <cctype>
#include <cstdint>
#include <sstream>
#include <vector>

namespace ort {

namespace {
    struct Parser {
        const std::string& s;
        size_t i = 0;
        size_t line = 1;
        size_t col = 1;

        struct Opener {
            char ch;
            size_t line, col;
        };
        std::vector<Opener> opener_stack;

        explicit Parser(const std::string& str) : s(str) {}

        char peek() const { return i < s.size() ? s[i] : '\0'; }

        char get() {
            if (i >= s.size()) return '\0';
            char c = s[i++];
            if (c == '\n') {
                ++line;
                col = 1;
            } else {
                ++col;
            }
            return c;
        }

        void push_opener(char ch) { opener_stack.push_back(Opener{ch, line, col - 1}); }
        void pop_opener() {
            if (not opener_stack.empty()) opener_stack.pop_back();
        }

        std::string line_text(size_t err_line) const {
            size_t pos = 0;
            for (size_t cur = 1; cur < err_line and pos < s.size(); ++pos)
                if (s[pos] == '\n') ++cur;
            size_t end = s.find('\n', pos);
            if (end == std::string::npos) end = s.size();
            return s.substr(pos, end - pos);
        }

        // Message, source line, caret under the column, and the innermost
        // open bracket when there is one.
        ParseError fail(const std::string& base) const { return fail(base, line, col); }

        ParseError fail(const std::string& base, size_t err_line, size_t err_col) const {
            std::string text = line_text(err_line);
            size_t caret_pos = err_col > 0 ? err_col - 1 : 0;
            if (caret_pos > text.size()) caret_pos = text.size();

            std::ostringstream ss;
            ss << base << " (line " << err_line << ", column " << err_col << ")\n";
            ss << text << "\n" << std::string(caret_pos, ' ') << '^';
            if (not opener_stack.empty()) {
                auto o = opener_stack.back();
                ss << "\n('" << o.ch << "' opened at line " << o.line << ", column " << o.col << ")";
            }
            return ParseError(ss.str(), err_line, err_col, text);
        }

        void skip_ws() {
            while (i < s.size()) {
                unsigned char c = static_cast<unsigned char>(s[i]);
                if (std::isspace(c)) {
                    get();
                    continue;
                }
                if (c == '/' and i + 1 < s.size() and s[i + 1] == '/') {
                    while (i < s.size() and peek() != '\n') get();
                    continue;
                }
                if (c == '/' and i + 1 < s.size() and s[i + 1] == '*') {
                    size_t l = line, cc = col;
                    get();
                    get();
                    bool closed = false;
                    while (i < s.size()) {
                        if (get() == '*' and peek() == '/') {
                            get();
                            closed = true;
                            break;
                        }
                    }
                    if (not closed) throw fail("unterminated block comment", l, cc);
                    continue;
                }
                break;
            }
        }

        Value parse_value() {
            skip_ws();
            char c = peek();
            if (c == 'n') return parse_literal("null", Value());
            if (c == 't') return parse_literal("true", Value(true));
            if (c == 'f') return parse_literal("false", Value(false));
            if (c == '"') return Value(parse_string());
            if (c == '[') return parse_array();
            if (c == '{') return parse_object();
            if (c == '-' or std::isdigit(static_cast<unsigned char>(c))) return parse_number();
            if (c == '\0') throw fail("unexpected end of input while parsing value");
            if (std::isalpha(static_cast<unsigned char>(c))) {
                size_t j = i;
                while (j < s.size() and std::isalnum(static_cast<unsigned char>(s[j]))) ++j;
                std::string token = s.substr(i, j - i);
                if (token == "True" or token == "False" or token == "None") {
                    std::string sug = token == "True" ? "true" : token == "False" ? "false" : "null";
                    throw fail("unexpected token '" + token + "'; did you mean '" + sug + "'?");
                }
            }
            throw fail("unexpected token while parsing value");
        }

        Value parse_literal(const char* word, Value v) {
            std::string w(word);
            if (s.compare(i, w.size(), w) != 0) throw fail("invalid literal");
            for (size_t k = 0; k < w.size(); ++k) get();
            return v;
        }

        static int hex_val(char c) {
            if ('0' <= c and c <= '9') return c - '0';
            if ('a' <= c and c <= 'f') return 10 + (c - 'a');
            if ('A' <= c and c <= 'F') return 10 + (c - 'A');
            return -1;
        }

        static void encode_utf8(uint32_t cp, std::string& out) {
            if (cp <= 0x7F) {
                out.push_back(static_cast<char>(cp));
            } else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        uint32_t read_hex4() {
            uint32_t v = 0;
            for (int k = 0; k < 4; ++k) {
                int hv = hex_val(peek());
                if (hv < 0) throw fail("invalid unicode escape");
                get();
                v = (v << 4) | static_cast<uint32_t>(hv);
            }
            return v;
        }

        std::string parse_string() {
            size_t l = line, c0 = col;
            get();  // opening quote
            std::string out;
            while (true) {
                if (i >= s.size()) throw fail("unterminated string", l, c0);
                char c = get();
                if (c == '"') break;
                if (c == '\n') throw fail("unterminated string", l, c0);
                if (c != '\\') {
                    out.push_back(c);
                    continue;
                }
                char e = get();
                switch (e) {
                    case '"':
                        out.push_back('"');
                        break;
                    case '\\':
                        out.push_back('\\');
                        break;
                    case '/':
                        out.push_back('/');
                        break;
                    case 'b':
                        out.push_back('\b');
                        break;
                    case 'f':
                        out.push_back('\f');
                        break;
                    case 'n':
                        out.push_back('\n');
                        break;
                    case 'r':
                        out.push_back('\r');
                        break;
                    case 't':
                        out.push_back('\t');
                        break;
                    case 'u': {
                        uint32_t cp = read_hex4();
                        // surrogate pair
                        if (cp >= 0xD800 and cp <= 0xDBFF and peek() == '\\' and i + 1 < s.size() and
                            s[i + 1] == 'u') {
                            get();
                            get();
                            uint32_t lo = read_hex4();
                            if (lo < 0xDC00 or lo > 0xDFFF) throw fail("invalid surrogate pair");
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        }
                        encode_utf8(cp, out);
                        break;
                    }
                    case '\0':
                        throw fail("unterminated string", l, c0);
                    default:
                        throw fail(std::string("unsupported escape sequence '\\") + e + "'");
                }
            }
            return out;
        }

        Value parse_number() {
            size_t start = i;
            size_t l = line, c0 = col;
            auto digits = [&]() {
                if (not std::isdigit(static_cast<unsigned char>(peek()))) throw fail("invalid number", l, c0);
                while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            };
            if (peek() == '-') get();
            digits();
            if (peek() == '.') {
                get();
                digits();
            }
            if (peek() == 'e' or peek() == 'E') {
                get();
                if (peek() == '+' or peek() == '-') get();
                digits();
            }
            auto d = ort::parse_number(s.substr(start, i - start));
            if (not d) throw fail("invalid number", l, c0);
            return Value(*d);
        }

        Value parse_array() {
            get();
            push_opener('[');
            Value::Array out;
            skip_ws();
            if (peek() == ']') {
                get();
                pop_opener();
                return Value(std::move(out));
            }
            while (true) {
                out.push_back(parse_value());
                skip_ws();
                char c = peek();
                if (c == ']') {
                    get();
                    break;
                }
                if (c == ',') {
                    get();
                    skip_ws();
                    if (peek() == ']') throw fail("trailing comma in array");
                    continue;
                }
                if (c == ':') throw fail("unexpected ':' after value; found key/value pair inside array");
                if (c == '\0') throw fail("unexpected end of input; expected ',' or ']'");
                throw fail("expected ',' or ']'");
            }
            pop_opener();
            return Value(std::move(out));
        }

        Value parse_object() {
            get();
            push_opener('{');
            Value::Object items;
            skip_ws();
            if (peek() == '}') {
                get();
                pop_opener();
                return Value(std::move(items));
            }
            while (true) {
                skip_ws();
                if (peek() != '"') {
                    size_t j = i;
                    while (j < s.size() and (std::isalnum(static_cast<unsigned char>(s[j])) or s[j] == '_')) ++j;
                    std::string base = "expected string key";
                    if (j > i) base += "; are you missing quotes around '" + s.substr(i, j - i) + "'?";
                    throw fail(base);
                }
                size_t kl = line, kc = col;
                std::string key = parse_string();
                for (auto const& p : items)
                    if (p.first == key) throw fail("duplicate key '" + key + "'", kl, kc);
                skip_ws();
                if (peek() != ':') throw fail("expected ':' after object key");
                get();
                Value v = parse_value();
                items.emplace_back(std::move(key), std::move(v));
                skip_ws();
                char c = peek();
                if (c == '}') {
                    get();
                    break;
                }
                if (c == ',') {
                    get();
                    skip_ws();
                    if (peek() == '}') throw fail("trailing comma in object");
                    continue;
                }
                if (c == '"') throw fail("expected ',' or '}'; is a comma missing before this key?");
                if (c == '\0') throw fail("unexpected end of input; expected ',' or '}'");
                throw fail("expected ',' or '}'");
            }
            pop_opener();
            return Value(std::move(items));
        }
    };
}  // namespace

Value parse_json(const std::string& text) {
    Parser p(text);
    p.skip_ws();
    if (p.peek() == '\0') throw p.fail("empty JSON document");
    Value v = p.parse_value();
    p.skip_ws();
    if (p.peek() != '\0') throw p.fail("extra data after JSON value");
    return v;
}

}  // namespace ort
