/// @file revision.hpp
/// @brief Revision: one committed version of a configuration.

#pragma once

#include <jsonrev-cpp/edit.hpp>
#include <jsonrev-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace jsonrev_cpp {

/// One immutable, numbered version of a configuration.
///
/// `edits` turn the previous version's document into this one (empty for
/// version 1). `document` is present on snapshots; revisions stored
/// without it are materialized by replaying edits from the nearest
/// earlier snapshot.
struct Revision {
    std::uint64_t version{0};        ///< Starts at 1, gapless per configuration.
    std::optional<Value> document;   ///< Full document, when stored.
    EditScript edits;                ///< Edits from the previous version.
    std::string author;              ///< Who committed this version.
    std::int64_t timestamp{0};       ///< Milliseconds since the Unix epoch.

    /// True when the full document is stored with this revision.
    auto is_snapshot() const noexcept -> bool { return document.has_value(); }

    auto operator==(const Revision&) const -> bool = default;
};

/// A summary of a revision for history display.
struct RevisionInfo {
    std::uint64_t version{0};
    std::string author;
    std::int64_t timestamp{0};
    std::size_t edit_count{0};
    bool snapshot{false};

    auto operator==(const RevisionInfo&) const -> bool = default;
};

/// Summarize a revision.
inline auto info(const Revision& rev) -> RevisionInfo {
    return RevisionInfo{
        .version = rev.version,
        .author = rev.author,
        .timestamp = rev.timestamp,
        .edit_count = rev.edits.size(),
        .snapshot = rev.is_snapshot(),
    };
}

}  // namespace jsonrev_cpp
