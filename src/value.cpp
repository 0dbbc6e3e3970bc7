#include <jsonrev-cpp/value.hpp>

#include <jsonrev-cpp/error.hpp>
#include <jsonrev-cpp/path.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <iterator>
#include <string>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace jsonrev_cpp {

// -- Number -------------------------------------------------------------------

namespace {

auto is_digit(char c) -> bool { return c >= '0' && c <= '9'; }

}  // anonymous namespace

auto is_number_text(std::string_view text) noexcept -> bool {
    auto pos = std::size_t{0};
    const auto n = text.size();

    if (pos < n && text[pos] == '-') ++pos;
    if (pos >= n) return false;

    // int: "0" or a non-zero digit followed by digits
    if (text[pos] == '0') {
        ++pos;
    } else if (is_digit(text[pos])) {
        while (pos < n && is_digit(text[pos])) ++pos;
    } else {
        return false;
    }

    // frac
    if (pos < n && text[pos] == '.') {
        ++pos;
        if (pos >= n || !is_digit(text[pos])) return false;
        while (pos < n && is_digit(text[pos])) ++pos;
    }

    // exp
    if (pos < n && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        if (pos < n && (text[pos] == '+' || text[pos] == '-')) ++pos;
        if (pos >= n || !is_digit(text[pos])) return false;
        while (pos < n && is_digit(text[pos])) ++pos;
    }

    return pos == n;
}

Number::Number(std::int64_t value) : text_{std::to_string(value)} {}

Number::Number(std::uint64_t value) : text_{std::to_string(value)} {}

Number::Number(double value) {
    if (!std::isfinite(value)) {
        throw Exception{ErrorKind::malformed_document,
                        "JSON numbers must be finite"};
    }
    auto buf = std::array<char, 32>{};
    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    if (ec != std::errc{}) {
        throw Exception{ErrorKind::malformed_document,
                        "cannot format floating point number"};
    }
    text_.assign(buf.data(), end);
}

auto Number::from_text(std::string_view text) -> Number {
    if (!is_number_text(text)) {
        throw Exception{ErrorKind::malformed_document,
                        "invalid JSON number: '" + std::string{text} + "'"};
    }
    auto n = Number{};
    n.text_.assign(text);
    return n;
}

auto Number::is_integer() const noexcept -> bool {
    return text_.find_first_of(".eE") == std::string::npos;
}

auto Number::as_int64() const -> std::optional<std::int64_t> {
    if (!is_integer()) return std::nullopt;
    auto value = std::int64_t{0};
    auto [end, ec] = std::from_chars(text_.data(), text_.data() + text_.size(), value);
    if (ec != std::errc{} || end != text_.data() + text_.size()) return std::nullopt;
    return value;
}

auto Number::as_uint64() const -> std::optional<std::uint64_t> {
    if (!is_integer() || text_.front() == '-') return std::nullopt;
    auto value = std::uint64_t{0};
    auto [end, ec] = std::from_chars(text_.data(), text_.data() + text_.size(), value);
    if (ec != std::errc{} || end != text_.data() + text_.size()) return std::nullopt;
    return value;
}

auto Number::as_double() const -> double {
    auto value = 0.0;
    // Out-of-range text saturates the same way strtod does.
    auto [end, ec] = std::from_chars(text_.data(), text_.data() + text_.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return std::strtod(text_.c_str(), nullptr);
    }
    return value;
}

// -- Object -------------------------------------------------------------------

Object::Object(std::initializer_list<Member> members) : members_{members} {}

auto Object::find(std::string_view key) -> Value* {
    auto it = std::ranges::find(members_, key, &Member::key);
    return it == members_.end() ? nullptr : &it->value;
}

auto Object::find(std::string_view key) const -> const Value* {
    auto it = std::ranges::find(members_, key, &Member::key);
    return it == members_.end() ? nullptr : &it->value;
}

auto Object::contains(std::string_view key) const -> bool {
    return find(key) != nullptr;
}

auto Object::insert(std::string key, Value value) -> bool {
    return try_emplace(std::move(key), std::move(value)).second;
}

auto Object::try_emplace(std::string key, Value value) -> std::pair<Value*, bool> {
    if (auto* existing = find(key)) return {existing, false};
    members_.push_back(Member{std::move(key), std::move(value)});
    return {&members_.back().value, true};
}

void Object::insert_or_assign(std::string key, Value value) {
    if (auto* existing = find(key)) {
        *existing = std::move(value);
        return;
    }
    members_.push_back(Member{std::move(key), std::move(value)});
}

auto Object::erase(std::string_view key) -> bool {
    auto it = std::ranges::find(members_, key, &Member::key);
    if (it == members_.end()) return false;
    members_.erase(it);
    return true;
}

auto Object::keys() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(members_.size());
    std::ranges::transform(members_, std::back_inserter(result), &Member::key);
    return result;
}

auto operator==(const Object& a, const Object& b) -> bool {
    return a.members_ == b.members_;
}

// -- Value --------------------------------------------------------------------

auto operator==(const Value& a, const Value& b) -> bool {
    return a.data_ == b.data_;
}

auto equivalent(const Value& a, const Value& b) -> bool {
    if (a.kind() != b.kind()) return false;

    if (const auto* oa = a.get_if<Object>()) {
        const auto& ob = *b.get_if<Object>();
        if (oa->size() != ob.size()) return false;
        return std::ranges::all_of(*oa, [&](const Member& m) {
            const auto* other = ob.find(m.key);
            return other != nullptr && equivalent(m.value, *other);
        });
    }

    if (const auto* aa = a.get_if<Array>()) {
        const auto& ab = *b.get_if<Array>();
        return std::ranges::equal(*aa, ab, [](const Value& x, const Value& y) {
            return equivalent(x, y);
        });
    }

    return a == b;
}

namespace {

void validate_at(const Value& value, Path& path) {
    std::visit(overload{
        [&](const Number& n) {
            if (!is_number_text(n.text())) {
                throw Exception{ErrorKind::malformed_document,
                                "invalid number '" + n.text() + "' at '" +
                                to_pointer(path) + "'"};
            }
        },
        [&](const Array& a) {
            for (std::size_t i = 0; i < a.size(); ++i) {
                path.emplace_back(i);
                validate_at(a[i], path);
                path.pop_back();
            }
        },
        [&](const Object& o) {
            auto seen = std::unordered_set<std::string_view>{};
            seen.reserve(o.size());
            for (const auto& m : o) {
                if (!seen.insert(m.key).second) {
                    throw Exception{ErrorKind::malformed_document,
                                    "duplicate key '" + m.key + "' in object at '" +
                                    to_pointer(path) + "'"};
                }
                path.emplace_back(m.key);
                validate_at(m.value, path);
                path.pop_back();
            }
        },
        [](const auto&) {},
    }, value.data());
}

}  // anonymous namespace

void validate(const Value& value) {
    auto path = Path{};
    validate_at(value, path);
}

}  // namespace jsonrev_cpp
