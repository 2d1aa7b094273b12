#pragma once

#include <ort/error.h>

#include <cstddef>
#include <initializer_list>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace ort {

namespace detail {
    template <typename T>
    struct is_vector : std::false_type {};
    template <typename T, typename A>
    struct is_vector<std::vector<T, A> > : std::true_type {};

    template <typename T>
    struct is_string_map : std::false_type {};
    template <typename T, typename C, typename A>
    struct is_string_map<std::map<std::string, T, C, A> > : std::true_type {};

    template <typename T>
    struct is_optional : std::false_type {};
    template <typename T>
    struct is_optional<std::optional<T> > : std::true_type {};

    template <typename T>
    struct always_false : std::false_type {};
}  // namespace detail

// A single ORT value: null, boolean, number, string, array or an object
// whose keys keep their insertion order. Every subtree is owned by its
// parent and copies are deep.
class Value {
  public:
    enum class TYPE { Null, Bool, Number, String, Array, Object };

    using Array = std::vector<Value>;
    using Object = std::vector<std::pair<std::string, Value> >;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : my_type(TYPE::Bool), m_bool(b) {}

    template <typename T,
              typename = std::enable_if_t<std::is_arithmetic<T>::value &&
                                          !std::is_same<T, bool>::value> >
    Value(T n) : my_type(TYPE::Number), m_number(static_cast<double>(n)) {}

    Value(const char* s) : my_type(TYPE::String), m_string(s) {}
    Value(std::string s) : my_type(TYPE::String), m_string(std::move(s)) {}

    Value(Array a) : my_type(TYPE::Array), m_array(std::move(a)) {}

    // Duplicate keys collapse onto the first occurrence; the last value wins.
    Value(Object items);

    template <typename T>
    Value(const std::vector<T>& v) : my_type(TYPE::Array) {
        m_array.reserve(v.size());
        for (auto const& e : v) m_array.emplace_back(Value(e));
    }

    template <typename T, typename C, typename A>
    Value(const std::map<std::string, T, C, A>& m) : my_type(TYPE::Object) {
        m_object.reserve(m.size());
        for (auto const& p : m) m_object.emplace_back(p.first, Value(p.second));
    }

    template <typename T>
    Value(const std::optional<T>& o) {
        if (o.has_value()) *this = Value(*o);
    }

    // Construct an object from (key, value) pairs, keeping their order.
    Value(std::initializer_list<std::pair<std::string, Value> > init);

    static Value array(std::initializer_list<Value> init = {});
    static Value object() { return Value(Object{}); }

    TYPE type() const noexcept { return my_type; }
    std::string typeString() const;

    bool isNull() const noexcept { return my_type == TYPE::Null; }
    bool isBool() const noexcept { return my_type == TYPE::Bool; }
    bool isNumber() const noexcept { return my_type == TYPE::Number; }
    bool isString() const noexcept { return my_type == TYPE::String; }
    bool isArray() const noexcept { return my_type == TYPE::Array; }
    bool isObject() const noexcept { return my_type == TYPE::Object; }

    std::optional<bool> asBool() const;
    std::optional<double> asNumber() const;
    std::optional<std::string> asString() const;
    std::optional<Array> asArray() const;
    std::optional<Object> asObject() const;

    // Borrowing accessors; throw TypeError on the wrong tag.
    const Array& elements() const;
    const Object& items() const;

    std::vector<std::string> keys() const;
    bool has(const std::string& key) const noexcept;

    const Value& get(const std::string& key) const;
    const Value& get(std::size_t index) const;

    void set(const std::string& key, Value value);
    void set(std::size_t index, Value value);
    void push_back(Value value);

    Value getOrDefault(const std::string& key, Value default_value = nullptr) const;

    std::size_t length() const;

    template <typename T>
    T toNative() const;

    bool operator==(const Value& rhs) const;
    bool operator!=(const Value& rhs) const { return not(*this == rhs); }

  private:
    TYPE my_type = TYPE::Null;
    bool m_bool = false;
    double m_number = 0.0;
    std::string m_string;
    Array m_array;
    Object m_object;

    const Value* find(const std::string& key) const noexcept;
    Value* find(const std::string& key) noexcept;
};

template <typename T>
T Value::toNative() const {
    if constexpr (std::is_same<T, Value>::value) {
        return *this;
    } else if constexpr (std::is_same<T, bool>::value) {
        if (my_type != TYPE::Bool) throw TypeError("not a bool");
        return m_bool;
    } else if constexpr (std::is_arithmetic<T>::value) {
        if (my_type != TYPE::Number) throw TypeError("not a number");
        return static_cast<T>(m_number);
    } else if constexpr (std::is_same<T, std::string>::value) {
        if (my_type != TYPE::String) throw TypeError("not a string");
        return m_string;
    } else if constexpr (std::is_same<T, std::nullptr_t>::value) {
        if (my_type != TYPE::Null) throw TypeError("not null");
        return nullptr;
    } else if constexpr (detail::is_optional<T>::value) {
        if (my_type == TYPE::Null) return T{};
        return T{toNative<typename T::value_type>()};
    } else if constexpr (detail::is_vector<T>::value) {
        if (my_type != TYPE::Array) throw TypeError("not an array");
        T out;
        out.reserve(m_array.size());
        for (auto const& e : m_array) out.push_back(e.template toNative<typename T::value_type>());
        return out;
    } else if constexpr (detail::is_string_map<T>::value) {
        if (my_type != TYPE::Object) throw TypeError("not an object");
        T out;
        for (auto const& [k, v] : m_object) out.emplace(k, v.template toNative<typename T::mapped_type>());
        return out;
    } else {
        static_assert(detail::always_false<T>::value, "unsupported native type for toNative");
    }
}

// Compact JSON rendering, handy for diagnostics.
std::ostream& operator<<(std::ostream& os, const Value& v);

}  // namespace ort
