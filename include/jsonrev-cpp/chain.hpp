/// @file chain.hpp
/// @brief ChainManager -- the primary API for jsonrev-cpp.

#pragma once

#include <jsonrev-cpp/edit.hpp>
#include <jsonrev-cpp/revision.hpp>
#include <jsonrev-cpp/store.hpp>
#include <jsonrev-cpp/value.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace jsonrev_cpp {

/// How much of each revision is written to the store.
enum class StorageMode : std::uint8_t {
    full_documents,  ///< Every revision keeps its full document.
    edits_only,      ///< Only snapshots keep documents; others keep edits.
};

/// Convert a StorageMode to its string representation.
constexpr auto to_string_view(StorageMode mode) noexcept -> std::string_view {
    switch (mode) {
        case StorageMode::full_documents: return "full_documents";
        case StorageMode::edits_only:     return "edits_only";
    }
    return "unknown";
}

/// Configuration for a ChainManager.
struct ChainOptions {
    StorageMode mode{StorageMode::full_documents};

    /// In edits_only mode, versions that are a multiple of this also keep
    /// their full document. 0 means only version 1 does.
    std::uint64_t snapshot_interval{0};

    /// Milliseconds since the Unix epoch. Defaults to the system clock.
    std::function<std::int64_t()> clock;
};

/// Result of ChainManager::verify().
struct VerifyReport {
    std::uint64_t head_version{0};
    std::uint64_t snapshots{0};                      ///< Revisions carrying a document.
    std::vector<std::uint64_t> missing_versions;     ///< Versions the store could not load.
    std::vector<std::uint64_t> mismatched_versions;  ///< Stored document differs from replay.

    auto ok() const noexcept -> bool {
        return missing_versions.empty() && mismatched_versions.empty();
    }
};

/// Owns the append-only version chains of a RevisionStore.
///
/// ChainManager holds no chain state of its own: every call reads the
/// store, so any number of managers (in any number of threads) may share
/// one store. Commits race through the store's check-and-set; the loser
/// gets a retryable concurrent_modification error.
///
/// @code
/// auto chain = ChainManager{std::make_shared<MemoryRevisionStore>()};
/// chain.commit("gateway", parse(R"({"port":80})"), "alice");
/// chain.commit("gateway", parse(R"({"port":443})"), "bob");
/// auto edits = chain.diff_between("gateway", 1, 2);  // [replace /port 443]
/// chain.rollback("gateway", 1, "carol");             // version 3 == version 1
/// @endcode
class ChainManager {
public:
    explicit ChainManager(std::shared_ptr<RevisionStore> store,
                          ChainOptions options = {});

    // -- Mutation -------------------------------------------------------------

    /// Append `candidate` as the next version of a configuration.
    ///
    /// The new revision carries diff(head, candidate) as its edits (empty
    /// for version 1 and for an unchanged document).
    /// @returns The committed revision with its document.
    /// @throws Exception malformed_document if the candidate is invalid,
    ///         concurrent_modification if another commit won the race.
    auto commit(std::string_view config_id, const Value& candidate,
                std::string_view author) -> Revision;

    /// Commit the document of an earlier version as a new head.
    /// History is never rewritten.
    auto rollback(std::string_view config_id, std::uint64_t to_version,
                  std::string_view author) -> Revision;

    // -- Queries --------------------------------------------------------------

    /// The document as it was at `version`.
    /// @throws Exception version_not_found outside [1, head].
    auto reconstruct(std::string_view config_id, std::uint64_t version) const -> Value;

    /// Edits that turn version `from` into version `to`.
    ///
    /// Adjacent versions return the stored edits. Any other pair is
    /// recomputed from the two reconstructed documents.
    auto diff_between(std::string_view config_id, std::uint64_t from,
                      std::uint64_t to) const -> EditScript;

    /// Head version, or nullopt for a configuration with no revisions.
    auto head_version(std::string_view config_id) const -> std::optional<std::uint64_t>;

    /// A revision with its document materialized.
    auto revision(std::string_view config_id, std::uint64_t version) const -> Revision;

    /// Summaries of every revision, oldest first.
    auto history(std::string_view config_id) const -> std::vector<RevisionInfo>;

    /// Check a chain end to end.
    ///
    /// Loads every revision, then replays the edits of each segment between
    /// stored snapshots (in parallel) and compares every stored document
    /// with its replayed counterpart.
    auto verify(std::string_view config_id) const -> VerifyReport;

    auto options() const noexcept -> const ChainOptions& { return options_; }

private:
    auto load(std::string_view config_id, std::uint64_t version) const -> Revision;
    auto require_head(std::string_view config_id) const -> std::uint64_t;
    auto keeps_document(std::uint64_t version) const noexcept -> bool;
    auto now() const -> std::int64_t;

    std::shared_ptr<RevisionStore> store_;
    ChainOptions options_;
};

}  // namespace jsonrev_cpp
