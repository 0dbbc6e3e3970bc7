/// @file value.hpp
/// @brief The JSON value model: Null, Number, Array, Object, Value.

#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jsonrev_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator==(const Null&) const -> bool = default;
};

/// A JSON number held as its decimal text.
///
/// The text is kept exactly as it was parsed or produced so that a
/// document survives diff/patch round trips and storage byte for byte:
/// `1.50` stays `1.50` and is a different value from `1.5`.
class Number {
public:
    /// Zero.
    Number() = default;

    explicit Number(std::int64_t value);
    explicit Number(std::uint64_t value);

    /// Shortest text that round-trips to the same double.
    /// @throws Exception (malformed_document) for NaN or infinity.
    explicit Number(double value);

    /// Adopt JSON number text verbatim.
    /// @throws Exception (malformed_document) if the text is not a JSON number.
    static auto from_text(std::string_view text) -> Number;

    /// The decimal text of this number.
    auto text() const noexcept -> const std::string& { return text_; }

    /// True when the text has no fraction or exponent part.
    auto is_integer() const noexcept -> bool;

    auto as_int64() const -> std::optional<std::int64_t>;
    auto as_uint64() const -> std::optional<std::uint64_t>;
    auto as_double() const -> double;

    auto operator==(const Number&) const -> bool = default;

private:
    std::string text_{"0"};
};

/// Check whether text matches the JSON number grammar (RFC 8259 section 6).
auto is_number_text(std::string_view text) noexcept -> bool;

class Value;
struct Member;

/// An ordered sequence of values.
using Array = std::vector<Value>;

/// An object: members in insertion order, keys expected to be unique.
///
/// Member order is part of the value. Lookups are linear, which keeps
/// order trivially stable and is fast for configuration-sized objects.
class Object {
public:
    using const_iterator = std::vector<Member>::const_iterator;

    Object() = default;
    Object(std::initializer_list<Member> members);

    auto size() const noexcept -> std::size_t;
    auto empty() const noexcept -> bool;
    auto begin() const noexcept -> const_iterator;
    auto end() const noexcept -> const_iterator;

    /// Get the value stored under key, or nullptr.
    auto find(std::string_view key) -> Value*;
    auto find(std::string_view key) const -> const Value*;
    auto contains(std::string_view key) const -> bool;

    /// Append a new member. Returns false (and changes nothing) if the
    /// key already exists.
    auto insert(std::string key, Value value) -> bool;

    /// Like insert(), but also returns the stored value (the existing one
    /// when the key was already present).
    auto try_emplace(std::string key, Value value) -> std::pair<Value*, bool>;

    /// Overwrite the value under key in place, or append a new member.
    void insert_or_assign(std::string key, Value value);

    /// Remove the member with this key. Returns false if it was absent.
    auto erase(std::string_view key) -> bool;

    /// Keys in member order.
    auto keys() const -> std::vector<std::string>;

    auto members() const noexcept -> const std::vector<Member>&;

    friend auto operator==(const Object& a, const Object& b) -> bool;

private:
    std::vector<Member> members_;
};

/// The six shapes a JSON value can take, in variant index order.
enum class ValueKind : std::uint8_t {
    null,
    boolean,
    number,
    string,
    array,
    object,
};

/// Convert a ValueKind to its string representation.
constexpr auto to_string_view(ValueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ValueKind::null:    return "null";
        case ValueKind::boolean: return "boolean";
        case ValueKind::number:  return "number";
        case ValueKind::string:  return "string";
        case ValueKind::array:   return "array";
        case ValueKind::object:  return "object";
    }
    return "unknown";
}

/// A JSON value: a closed tagged union over the six JSON shapes.
///
/// @code
/// auto doc = Value{Object{
///     {"name", "gateway"},
///     {"ports", Array{80, 443}},
///     {"tls", true},
/// }};
/// @endcode
class Value {
public:
    using Storage = std::variant<Null, bool, Number, std::string, Array, Object>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(Null) {}
    Value(bool b) : data_{b} {}
    Value(int i) : data_{Number{static_cast<std::int64_t>(i)}} {}
    Value(std::int64_t i) : data_{Number{i}} {}
    Value(std::uint64_t u) : data_{Number{u}} {}
    Value(double d) : data_{Number{d}} {}
    Value(Number n) : data_{std::move(n)} {}
    Value(const char* s) : data_{std::string{s}} {}
    Value(std::string s) : data_{std::move(s)} {}
    Value(Array a) : data_{std::move(a)} {}
    Value(Object o) : data_{std::move(o)} {}

    auto kind() const noexcept -> ValueKind {
        return static_cast<ValueKind>(data_.index());
    }

    auto is_null() const noexcept -> bool { return kind() == ValueKind::null; }
    auto is_boolean() const noexcept -> bool { return kind() == ValueKind::boolean; }
    auto is_number() const noexcept -> bool { return kind() == ValueKind::number; }
    auto is_string() const noexcept -> bool { return kind() == ValueKind::string; }
    auto is_array() const noexcept -> bool { return kind() == ValueKind::array; }
    auto is_object() const noexcept -> bool { return kind() == ValueKind::object; }
    auto is_container() const noexcept -> bool { return is_array() || is_object(); }

    /// Pointer to the alternative T, or nullptr when another shape is held.
    template <typename T>
    auto get_if() const noexcept -> const T* { return std::get_if<T>(&data_); }

    template <typename T>
    auto get_if() noexcept -> T* { return std::get_if<T>(&data_); }

    auto data() const noexcept -> const Storage& { return data_; }
    auto data() noexcept -> Storage& { return data_; }

    /// Exact structural identity: member order and number text count.
    friend auto operator==(const Value& a, const Value& b) -> bool;

private:
    Storage data_;
};

/// One key/value entry of an Object.
struct Member {
    std::string key;
    Value value;

    auto operator==(const Member&) const -> bool = default;
};

inline auto Object::size() const noexcept -> std::size_t { return members_.size(); }
inline auto Object::empty() const noexcept -> bool { return members_.empty(); }
inline auto Object::begin() const noexcept -> const_iterator { return members_.begin(); }
inline auto Object::end() const noexcept -> const_iterator { return members_.end(); }
inline auto Object::members() const noexcept -> const std::vector<Member>& { return members_; }

/// Structural equality that ignores object member order.
///
/// Two objects are equivalent when they have the same key set and
/// equivalent values under each key. Arrays stay order-sensitive.
auto equivalent(const Value& a, const Value& b) -> bool;

/// Check that a value is a well-formed JSON document.
/// @throws Exception (malformed_document) on a duplicate object key or an
///         invalid number, naming the JSON Pointer of the offending node.
void validate(const Value& value);

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const Array& a) { ... },
///     [](const Object& o) { ... },
///     [](const auto&) { ... },
/// }, value.data());
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace jsonrev_cpp
