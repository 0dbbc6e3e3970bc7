#include <jsonrev-cpp/store.hpp>

#include <jsonrev-cpp/codec.hpp>
#include <jsonrev-cpp/error.hpp>

#include <numeric>
#include <string>
#include <utility>

namespace jsonrev_cpp {

auto MemoryRevisionStore::find_chain(std::string_view config_id) const
    -> std::shared_ptr<Chain> {
    auto lock = std::shared_lock{mutex_};
    auto it = chains_.find(config_id);
    return it == chains_.end() ? nullptr : it->second;
}

auto MemoryRevisionStore::find_or_create_chain(std::string_view config_id)
    -> std::shared_ptr<Chain> {
    if (auto chain = find_chain(config_id)) return chain;
    auto lock = std::unique_lock{mutex_};
    auto [it, inserted] = chains_.try_emplace(std::string{config_id}, nullptr);
    if (inserted) it->second = std::make_shared<Chain>();
    return it->second;
}

auto MemoryRevisionStore::load_at(const Chain& chain, std::string_view config_id,
                                  std::uint64_t version) const -> std::optional<Revision> {
    if (version == 0 || version > chain.blobs.size()) return std::nullopt;
    auto rev = decode_revision(chain.blobs[version - 1]);
    if (!rev || rev->version != version) {
        throw Exception{ErrorKind::corrupt_revision,
                        "stored revision " + std::to_string(version) + " of '" +
                        std::string{config_id} + "' cannot be decoded"};
    }
    return rev;
}

auto MemoryRevisionStore::load_head(std::string_view config_id) const
    -> std::optional<Revision> {
    auto chain = find_chain(config_id);
    if (!chain) return std::nullopt;
    auto lock = std::lock_guard{chain->mutex};
    return load_at(*chain, config_id, chain->blobs.size());
}

auto MemoryRevisionStore::load_revision(std::string_view config_id,
                                        std::uint64_t version) const
    -> std::optional<Revision> {
    auto chain = find_chain(config_id);
    if (!chain) return std::nullopt;
    auto lock = std::lock_guard{chain->mutex};
    return load_at(*chain, config_id, version);
}

auto MemoryRevisionStore::append_revision(std::string_view config_id,
                                          std::uint64_t expected_previous_version,
                                          const Revision& revision) -> AppendResult {
    if (revision.version != expected_previous_version + 1) {
        throw Exception{ErrorKind::corrupt_revision,
                        "revision " + std::to_string(revision.version) +
                        " cannot follow version " +
                        std::to_string(expected_previous_version)};
    }
    // Encode before taking the lock; the blob does not depend on the chain.
    auto blob = encode_revision(revision);

    auto chain = find_or_create_chain(config_id);
    auto lock = std::lock_guard{chain->mutex};
    if (chain->blobs.size() != expected_previous_version) {
        return AppendResult::version_conflict;
    }
    chain->blobs.push_back(std::move(blob));
    return AppendResult::appended;
}

auto MemoryRevisionStore::versions(std::string_view config_id) const -> std::uint64_t {
    auto chain = find_chain(config_id);
    if (!chain) return 0;
    auto lock = std::lock_guard{chain->mutex};
    return chain->blobs.size();
}

auto MemoryRevisionStore::config_ids() const -> std::vector<std::string> {
    auto lock = std::shared_lock{mutex_};
    auto ids = std::vector<std::string>{};
    ids.reserve(chains_.size());
    for (const auto& [id, chain] : chains_) {
        auto chain_lock = std::lock_guard{chain->mutex};
        if (!chain->blobs.empty()) ids.push_back(id);
    }
    return ids;
}

auto MemoryRevisionStore::stored_bytes(std::string_view config_id) const -> std::size_t {
    auto chain = find_chain(config_id);
    if (!chain) return 0;
    auto lock = std::lock_guard{chain->mutex};
    return std::accumulate(chain->blobs.begin(), chain->blobs.end(), std::size_t{0},
                           [](std::size_t total, const std::vector<std::byte>& blob) {
                               return total + blob.size();
                           });
}

void MemoryRevisionStore::replace_blob(std::string_view config_id, std::uint64_t version,
                                       std::vector<std::byte> blob) {
    auto chain = find_chain(config_id);
    if (!chain) {
        throw Exception{ErrorKind::version_not_found,
                        "no revisions stored for '" + std::string{config_id} + "'"};
    }
    auto lock = std::lock_guard{chain->mutex};
    if (version == 0 || version > chain->blobs.size()) {
        throw Exception{ErrorKind::version_not_found,
                        "version " + std::to_string(version) + " of '" +
                        std::string{config_id} + "' is not stored"};
    }
    chain->blobs[version - 1] = std::move(blob);
}

}  // namespace jsonrev_cpp
