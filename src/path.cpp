#include <jsonrev-cpp/path.hpp>

#include <jsonrev-cpp/error.hpp>

#include <charconv>
#include <string>
#include <system_error>
#include <utility>

namespace jsonrev_cpp {

auto key_to_index(std::string_view key) -> std::optional<std::size_t> {
    if (key.empty()) return std::nullopt;
    // Leading zeros are not allowed per RFC 6901 (except "0" itself)
    if (key.size() > 1 && key[0] == '0') return std::nullopt;
    for (auto c : key) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    auto idx = std::size_t{0};
    auto [end, ec] = std::from_chars(key.data(), key.data() + key.size(), idx);
    if (ec != std::errc{} || end != key.data() + key.size()) return std::nullopt;
    return idx;
}

namespace {

// Descend one segment. Works for both const and mutable values.
template <typename V>
auto step(V& node, const PathElement& element) -> V* {
    if (const auto* k = std::get_if<std::string>(&element)) {
        if (auto* obj = node.template get_if<Object>()) {
            return obj->find(*k);
        }
        if (auto* arr = node.template get_if<Array>()) {
            auto idx = key_to_index(*k);
            if (!idx || *idx >= arr->size()) return nullptr;
            return &(*arr)[*idx];
        }
        return nullptr;
    }

    auto idx = std::get<std::size_t>(element);
    if (auto* arr = node.template get_if<Array>()) {
        if (idx >= arr->size()) return nullptr;
        return &(*arr)[idx];
    }
    return nullptr;
}

template <typename V>
auto find_impl(V& root, const Path& path) -> V* {
    auto* node = &root;
    for (const auto& element : path) {
        node = step(*node, element);
        if (!node) return nullptr;
    }
    return node;
}

void append_escaped(std::string& out, std::string_view key) {
    for (auto c : key) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out.push_back(c);
        }
    }
}

}  // anonymous namespace

auto find(const Value& root, const Path& path) -> const Value* {
    return find_impl(root, path);
}

auto find(Value& root, const Path& path) -> Value* {
    return find_impl(root, path);
}

auto at(const Value& root, const Path& path) -> const Value& {
    const auto* node = &root;
    for (std::size_t i = 0; i < path.size(); ++i) {
        node = step(*node, path[i]);
        if (!node) {
            auto prefix = Path(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(i) + 1);
            throw Exception{ErrorKind::path_not_found,
                            "no node at '" + to_pointer(prefix) + "'"};
        }
    }
    return *node;
}

auto to_pointer(const Path& path) -> std::string {
    auto result = std::string{};
    for (const auto& element : path) {
        result.push_back('/');
        std::visit(overload{
            [&](const std::string& k) { append_escaped(result, k); },
            [&](std::size_t i) { result += std::to_string(i); },
        }, element);
    }
    return result;
}

auto parse_pointer(std::string_view pointer) -> Path {
    if (pointer.empty()) return {};
    if (pointer[0] != '/') {
        throw Exception{ErrorKind::malformed_edit,
                        "JSON Pointer must start with '/' or be empty: '" +
                        std::string{pointer} + "'"};
    }
    auto path = Path{};
    auto pos = std::size_t{1};
    while (true) {
        auto next = pointer.find('/', pos);
        auto raw = pointer.substr(pos, next == std::string_view::npos ? std::string_view::npos
                                                                      : next - pos);
        auto segment = std::string{};
        segment.reserve(raw.size());
        for (std::size_t i = 0; i < raw.size(); ++i) {
            if (raw[i] != '~') {
                segment.push_back(raw[i]);
                continue;
            }
            if (i + 1 >= raw.size() || (raw[i + 1] != '0' && raw[i + 1] != '1')) {
                throw Exception{ErrorKind::malformed_edit,
                                "bad '~' escape in JSON Pointer: '" +
                                std::string{pointer} + "'"};
            }
            segment.push_back(raw[i + 1] == '0' ? '~' : '/');
            ++i;
        }
        path.emplace_back(std::move(segment));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return path;
}

}  // namespace jsonrev_cpp
