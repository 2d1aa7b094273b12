#include <ort/value.h>
#include <ort/json.h>

#include <algorithm>
#include <sstream>

namespace ort {

Value::Value(Object items) : my_type(TYPE::Object) {
    m_object.reserve(items.size());
    for (auto& p : items) {
        if (Value* existing = find(p.first))
            *existing = std::move(p.second);
        else
            m_object.emplace_back(std::move(p.first), std::move(p.second));
    }
}

Value::Value(std::initializer_list<std::pair<std::string, Value> > init)
    : Value(Object(init.begin(), init.end())) {}

Value Value::array(std::initializer_list<Value> init) { return Value(Array(init)); }

std::string Value::typeString() const {
    switch (my_type) {
        case TYPE::Null:
            return "Null";
        case TYPE::Bool:
            return "Bool";
        case TYPE::Number:
            return "Number";
        case TYPE::String:
            return "String";
        case TYPE::Array:
            return "Array";
        case TYPE::Object:
            return "Object";
    }
    throw std::logic_error("Not a valid type");
}

std::optional<bool> Value::asBool() const {
    if (my_type == TYPE::Bool) return m_bool;
    return std::nullopt;
}

std::optional<double> Value::asNumber() const {
    if (my_type == TYPE::Number) return m_number;
    return std::nullopt;
}

std::optional<std::string> Value::asString() const {
    if (my_type == TYPE::String) return m_string;
    return std::nullopt;
}

std::optional<Value::Array> Value::asArray() const {
    if (my_type == TYPE::Array) return m_array;
    return std::nullopt;
}

std::optional<Value::Object> Value::asObject() const {
    if (my_type == TYPE::Object) return m_object;
    return std::nullopt;
}

const Value::Array& Value::elements() const {
    if (my_type != TYPE::Array) throw TypeError("not an array");
    return m_array;
}

const Value::Object& Value::items() const {
    if (my_type != TYPE::Object) throw TypeError("not an object");
    return m_object;
}

std::vector<std::string> Value::keys() const {
    std::vector<std::string> out;
    if (my_type != TYPE::Object) return out;
    out.reserve(m_object.size());
    for (auto const& p : m_object) out.push_back(p.first);
    return out;
}

const Value* Value::find(const std::string& key) const noexcept {
    for (auto const& p : m_object)
        if (p.first == key) return &p.second;
    return nullptr;
}

Value* Value::find(const std::string& key) noexcept {
    for (auto& p : m_object)
        if (p.first == key) return &p.second;
    return nullptr;
}

bool Value::has(const std::string& key) const noexcept {
    if (my_type != TYPE::Object) return false;
    return find(key) != nullptr;
}

const Value& Value::get(const std::string& key) const {
    if (my_type != TYPE::Object) throw TypeError("not an object");
    if (const Value* v = find(key)) return *v;
    throw KeyError("key not found: " + key);
}

const Value& Value::get(std::size_t index) const {
    if (my_type != TYPE::Array) throw TypeError("not an array");
    if (index >= m_array.size())
        throw IndexError("index out of bounds: " + std::to_string(index));
    return m_array[index];
}

void Value::set(const std::string& key, Value value) {
    if (my_type != TYPE::Object) throw TypeError("not an object");
    if (Value* existing = find(key))
        *existing = std::move(value);
    else
        m_object.emplace_back(key, std::move(value));
}

void Value::set(std::size_t index, Value value) {
    if (my_type != TYPE::Array) throw TypeError("not an array");
    if (index >= m_array.size())
        throw IndexError("index out of bounds: " + std::to_string(index));
    m_array[index] = std::move(value);
}

void Value::push_back(Value value) {
    if (my_type != TYPE::Array) throw TypeError("not an array");
    m_array.push_back(std::move(value));
}

Value Value::getOrDefault(const std::string& key, Value default_value) const {
    if (my_type != TYPE::Object) return default_value;
    if (const Value* v = find(key)) return *v;
    return default_value;
}

std::size_t Value::length() const {
    switch (my_type) {
        case TYPE::Array:
            return m_array.size();
        case TYPE::Object:
            return m_object.size();
        default:
            break;
    }
    throw TypeError("object of type " + typeString() + " has no length");
}

bool Value::operator==(const Value& rhs) const {
    if (my_type != rhs.my_type) return false;
    switch (my_type) {
        case TYPE::Null:
            return true;
        case TYPE::Bool:
            return m_bool == rhs.m_bool;
        case TYPE::Number:
            return m_number == rhs.m_number;
        case TYPE::String:
            return m_string == rhs.m_string;
        case TYPE::Array:
            return m_array == rhs.m_array;
        case TYPE::Object: {
            // key order is not part of object identity
            if (m_object.size() != rhs.m_object.size()) return false;
            return std::all_of(m_object.begin(), m_object.end(), [&](auto const& p) {
                const Value* other = rhs.find(p.first);
                return other != nullptr and *other == p.second;
            });
        }
    }
    return false;
}

std::ostream& operator<<(std::ostream& os, const Value& v) {
    os << dump_json(v);
    return os;
}

}  // namespace ort
