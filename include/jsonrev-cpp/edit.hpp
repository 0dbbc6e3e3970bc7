/// @file edit.hpp
/// @brief Edit operations: the structural changes a diff is made of.

#pragma once

#include <jsonrev-cpp/path.hpp>
#include <jsonrev-cpp/value.hpp>

#include <cstdint>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jsonrev_cpp {

/// Insert a value. Into an array, later elements shift right; into an
/// object, the key must not already exist.
struct EditAdd {
    Value value;  ///< The inserted value.
    auto operator==(const EditAdd&) const -> bool = default;
};

/// Delete the addressed node. Array removal shifts later elements left.
struct EditRemove {
    auto operator==(const EditRemove&) const -> bool = default;
};

/// Overwrite the addressed node, which must already exist.
struct EditReplace {
    Value value;  ///< The new value.
    auto operator==(const EditReplace&) const -> bool = default;
};

/// The set of possible edit actions.
using EditAction = std::variant<
    EditAdd,
    EditRemove,
    EditReplace
>;

/// A single edit operation: an action applied at a path.
///
/// Paths are resolved against the document as it stands after every
/// earlier operation of the same script has been applied.
struct EditOp {
    Path path;          ///< Where the action applies.
    EditAction action;  ///< What happens there.

    static auto add(Path path, Value value) -> EditOp {
        return EditOp{std::move(path), EditAdd{std::move(value)}};
    }
    static auto remove(Path path) -> EditOp {
        return EditOp{std::move(path), EditRemove{}};
    }
    static auto replace(Path path, Value value) -> EditOp {
        return EditOp{std::move(path), EditReplace{std::move(value)}};
    }

    auto operator==(const EditOp&) const -> bool = default;
};

/// An ordered sequence of edit operations.
using EditScript = std::vector<EditOp>;

/// The operation names of the serialized form, in EditAction index order.
enum class EditKind : std::uint8_t {
    add,
    remove,
    replace,
};

/// Convert an EditKind to its string representation.
constexpr auto to_string_view(EditKind kind) noexcept -> std::string_view {
    switch (kind) {
        case EditKind::add:     return "add";
        case EditKind::remove:  return "remove";
        case EditKind::replace: return "replace";
    }
    return "unknown";
}

inline auto kind(const EditOp& op) noexcept -> EditKind {
    return static_cast<EditKind>(op.action.index());
}

}  // namespace jsonrev_cpp
