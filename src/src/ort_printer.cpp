#include <ort/ort.h>
#include <ort/lexer.h>

#include <algorithm>
#include <optional>
#include <sstream>
#include <vector>

namespace ort {

namespace {
    // A header column; children form a positional tuple group.
    struct Column {
        std::string name;
        std::vector<Column> children;
    };

    std::vector<std::string> sorted_keys(const Value& obj) {
        auto k = obj.keys();
        std::sort(k.begin(), k.end());
        return k;
    }

    bool is_uniform_object_array(const Value::Array& arr) {
        if (arr.empty() or not arr.front().isObject()) return false;
        const auto first = sorted_keys(arr.front());
        for (size_t i = 1; i < arr.size(); ++i) {
            if (not arr[i].isObject()) return false;
            if (sorted_keys(arr[i]) != first) return false;
        }
        return true;
    }

    const Value* field_of(const Value& obj, const std::string& key) {
        return obj.has(key) ? &obj.get(key) : nullptr;
    }

    template <typename T, typename F>
    std::string join(const std::vector<T>& items, F render) {
        std::string out;
        for (size_t i = 0; i < items.size(); ++i) {
            if (i) out.push_back(',');
            out += render(items[i]);
        }
        return out;
    }

    std::string literal(const Value& v) {
        switch (v.type()) {
            case Value::TYPE::Null:
                return std::string();
            case Value::TYPE::Bool:
                return *v.asBool() ? "true" : "false";
            case Value::TYPE::Number:
                return format_number(*v.asNumber());
            case Value::TYPE::String:
                return escape(*v.asString());
            case Value::TYPE::Array:
                if (v.elements().empty()) return "[]";
                return "[" + join(v.elements(), literal) + "]";
            case Value::TYPE::Object:
                if (v.items().empty()) return "()";
                return "(" +
                       join(v.items(),
                            [](auto const& p) { return p.first + ":" + literal(p.second); }) +
                       ")";
        }
        return std::string();
    }

    std::string cell(const Value* v, const Column& col);

    // Columns follow the sample row's key order. A field becomes a tuple
    // group only when every row holds null or an object with the sample's
    // key set there; otherwise its objects are written as inline literals.
    std::vector<Column> columns_for(const Value& sample, const std::vector<const Value*>& rows) {
        std::vector<Column> cols;
        for (auto const& [key, value] : sample.items()) {
            Column col{key, {}};
            if (value.isObject() and value.length() > 0) {
                const auto shape = sorted_keys(value);
                std::vector<const Value*> cells;
                bool fits = true;
                for (const Value* row : rows) {
                    const Value* here = field_of(*row, key);
                    if (here == nullptr or here->isNull()) continue;
                    if (not here->isObject() or sorted_keys(*here) != shape) {
                        fits = false;
                        break;
                    }
                    cells.push_back(here);
                }
                if (fits) col.children = columns_for(value, cells);
                // a tuple that renders as "()" reads back as an empty object
                for (const Value* c : cells) {
                    if (not col.children.empty() and cell(c, col) == "()") col.children.clear();
                }
            }
            cols.push_back(std::move(col));
        }
        return cols;
    }

    std::string header_of(const std::vector<Column>& cols) {
        return join(cols, [](const Column& c) {
            if (c.children.empty()) return c.name;
            return c.name + "(" + header_of(c.children) + ")";
        });
    }

    std::string cell(const Value* v, const Column& col) {
        if (v == nullptr or v->isNull()) return std::string();
        if (not col.children.empty() and v->isObject()) {
            auto tuple = [&](const Column& c) { return cell(field_of(*v, c.name), c); };
            return "(" + join(col.children, tuple) + ")";
        }
        return literal(*v);
    }

    // A row that reads as blank, a comment or a header would be lost on the
    // way back in.
    bool row_survives(const std::string& row) {
        std::string t = trim(row);
        if (t.empty() or t.front() == '#' or t.front() == ':') return false;
        return t.back() != ':';
    }

    // `prefix` is "key" for a named section and empty for the anonymous form.
    std::optional<std::string> table(const std::string& prefix, const Value::Array& arr) {
        std::vector<const Value*> rows;
        rows.reserve(arr.size());
        for (auto const& e : arr) rows.push_back(&e);
        const auto cols = columns_for(arr.front(), rows);

        std::ostringstream out;
        out << prefix << ':' << header_of(cols) << ':';
        for (const Value* row : rows) {
            std::string line =
                        join(cols, [&](const Column& c) { return cell(field_of(*row, c.name), c); });
            if (not row_survives(line)) return std::nullopt;
            out << '\n' << line;
        }
        return out.str();
    }

    std::string section(const std::string& key, const Value& v) {
        if (v.isArray() and is_uniform_object_array(v.elements())) {
            if (auto t = table(key, v.elements())) return *t;
        }
        return key + ":\n" + literal(v);
    }
}  // namespace

std::string generate(const Value& value) {
    if (value.isObject()) {
        const auto& items = value.items();
        if (items.size() == 1) return section(items.front().first, items.front().second);

        std::string out;
        for (size_t i = 0; i < items.size(); ++i) {
            out += section(items[i].first, items[i].second);
            out += (i + 1 < items.size()) ? "\n\n" : "\n";
        }
        return out;
    }
    if (value.isArray()) {
        const auto& arr = value.elements();
        // a single anonymous row reads back as a bare record, so one-element
        // arrays keep the literal form
        if (arr.size() > 1 and is_uniform_object_array(arr)) {
            if (auto t = table("", arr)) return *t;
        }
        return ":" + literal(value);
    }
    return literal(value);
}

}  // namespace ort
