#include <jsonrev-cpp/patch.hpp>

#include <jsonrev-cpp/error.hpp>
#include <jsonrev-cpp/path.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace jsonrev_cpp {

namespace {

[[noreturn]] void throw_not_found(const Path& path) {
    throw Exception{ErrorKind::path_not_found,
                    "no node at '" + to_pointer(path) + "'"};
}

// Resolve the container holding the last segment of a non-empty path.
auto parent_of(Value& document, const Path& path) -> Value& {
    auto parent_path = Path(path.begin(), path.end() - 1);
    auto* parent = find(document, parent_path);
    if (!parent) {
        // at() reports the first segment that fails to resolve
        static_cast<void>(at(document, parent_path));
        throw_not_found(parent_path);
    }
    return *parent;
}

// Index addressed inside an array by the last segment of an edit path.
// `allow_end` admits size() and "-" for inserts.
auto array_slot(const Array& arr, const PathElement& element, bool allow_end)
    -> std::optional<std::size_t> {
    auto idx = std::optional<std::size_t>{};
    if (const auto* k = std::get_if<std::string>(&element)) {
        if (allow_end && *k == "-") return arr.size();
        idx = key_to_index(*k);
    } else {
        idx = std::get<std::size_t>(element);
    }
    if (!idx) return std::nullopt;
    if (*idx > arr.size() || (*idx == arr.size() && !allow_end)) return std::nullopt;
    return idx;
}

void apply_add(Value& document, const Path& path, const Value& value) {
    if (path.empty()) {
        throw Exception{ErrorKind::invalid_edit, "cannot add at the document root"};
    }
    auto& parent = parent_of(document, path);
    const auto& last = path.back();

    if (auto* obj = parent.get_if<Object>()) {
        const auto* k = std::get_if<std::string>(&last);
        if (!k) throw_not_found(path);
        if (!obj->insert(*k, value)) {
            throw Exception{ErrorKind::conflicting_add,
                            "key already exists at '" + to_pointer(path) + "'"};
        }
        return;
    }
    if (auto* arr = parent.get_if<Array>()) {
        auto idx = array_slot(*arr, last, true);
        if (!idx) throw_not_found(path);
        arr->insert(arr->begin() + static_cast<std::ptrdiff_t>(*idx), value);
        return;
    }
    throw_not_found(path);
}

void apply_remove(Value& document, const Path& path) {
    if (path.empty()) {
        throw Exception{ErrorKind::invalid_edit, "cannot remove the document root"};
    }
    auto& parent = parent_of(document, path);
    const auto& last = path.back();

    if (auto* obj = parent.get_if<Object>()) {
        const auto* k = std::get_if<std::string>(&last);
        if (!k || !obj->erase(*k)) throw_not_found(path);
        return;
    }
    if (auto* arr = parent.get_if<Array>()) {
        auto idx = array_slot(*arr, last, false);
        if (!idx) throw_not_found(path);
        arr->erase(arr->begin() + static_cast<std::ptrdiff_t>(*idx));
        return;
    }
    throw_not_found(path);
}

void apply_replace(Value& document, const Path& path, const Value& value) {
    auto* target = find(document, path);
    if (!target) {
        static_cast<void>(at(document, path));
        throw_not_found(path);
    }
    *target = value;
}

void apply_one(Value& document, const EditOp& op) {
    std::visit(overload{
        [&](const EditAdd& a) { apply_add(document, op.path, a.value); },
        [&](const EditRemove&) { apply_remove(document, op.path); },
        [&](const EditReplace& r) { apply_replace(document, op.path, r.value); },
    }, op.action);
}

}  // anonymous namespace

auto apply_edits(const Value& document, const EditScript& edits) -> Value {
    auto result = document;
    for (std::size_t i = 0; i < edits.size(); ++i) {
        try {
            apply_one(result, edits[i]);
        } catch (const Exception& e) {
            throw Exception{e.kind(),
                            "edit " + std::to_string(i) + " (" +
                            std::string{to_string_view(kind(edits[i]))} + "): " +
                            e.what()};
        }
    }
    return result;
}

void apply_in_place(Value& document, const EditScript& edits) {
    auto result = apply_edits(document, edits);
    document = std::move(result);
}

}  // namespace jsonrev_cpp
