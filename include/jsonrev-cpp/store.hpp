/// @file store.hpp
/// @brief The storage collaborator interface and an in-memory implementation.

#pragma once

#include <jsonrev-cpp/revision.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace jsonrev_cpp {

/// Outcome of RevisionStore::append_revision.
enum class AppendResult : std::uint8_t {
    appended,          ///< The revision is the new head.
    version_conflict,  ///< The head was not `expected_previous_version`.
};

/// Where revisions live. Every call is atomic on its own.
///
/// ChainManager is the only writer. Implementations must reject an append
/// unless the current head version equals `expected_previous_version`
/// (0 meaning "no revision yet"), which is what keeps chains gapless under
/// concurrent commits.
class RevisionStore {
public:
    virtual ~RevisionStore() = default;

    /// The highest-numbered revision, or nullopt for an empty chain.
    virtual auto load_head(std::string_view config_id) const
        -> std::optional<Revision> = 0;

    /// A specific revision, or nullopt if it was never stored.
    virtual auto load_revision(std::string_view config_id, std::uint64_t version) const
        -> std::optional<Revision> = 0;

    /// Store a revision as the new head if the head is still
    /// `expected_previous_version`.
    virtual auto append_revision(std::string_view config_id,
                                 std::uint64_t expected_previous_version,
                                 const Revision& revision) -> AppendResult = 0;

    /// Head version of a chain, 0 when empty.
    virtual auto versions(std::string_view config_id) const -> std::uint64_t = 0;
};

/// An in-process RevisionStore.
///
/// Revisions are kept as encoded blobs (see codec.hpp), so every load
/// decodes an independent copy. Each configuration has its own lock:
/// appends to different configurations never wait on each other.
///
/// @code
/// auto store = std::make_shared<MemoryRevisionStore>();
/// auto chain = ChainManager{store};
/// @endcode
class MemoryRevisionStore : public RevisionStore {
public:
    MemoryRevisionStore() = default;

    MemoryRevisionStore(const MemoryRevisionStore&) = delete;
    auto operator=(const MemoryRevisionStore&) -> MemoryRevisionStore& = delete;

    auto load_head(std::string_view config_id) const
        -> std::optional<Revision> override;
    auto load_revision(std::string_view config_id, std::uint64_t version) const
        -> std::optional<Revision> override;
    auto append_revision(std::string_view config_id,
                         std::uint64_t expected_previous_version,
                         const Revision& revision) -> AppendResult override;
    auto versions(std::string_view config_id) const -> std::uint64_t override;

    /// Identifiers of every configuration with at least one revision.
    auto config_ids() const -> std::vector<std::string>;

    /// Total encoded size of a chain in bytes.
    auto stored_bytes(std::string_view config_id) const -> std::size_t;

    /// Overwrite a stored blob. Lets tests simulate storage corruption.
    void replace_blob(std::string_view config_id, std::uint64_t version,
                      std::vector<std::byte> blob);

private:
    struct Chain {
        mutable std::mutex mutex;
        std::vector<std::vector<std::byte>> blobs;  // blobs[v - 1] is version v
    };

    auto find_chain(std::string_view config_id) const -> std::shared_ptr<Chain>;
    auto find_or_create_chain(std::string_view config_id) -> std::shared_ptr<Chain>;
    auto load_at(const Chain& chain, std::string_view config_id,
                 std::uint64_t version) const -> std::optional<Revision>;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<Chain>, std::less<>> chains_;
};

}  // namespace jsonrev_cpp
