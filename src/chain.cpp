#include <jsonrev-cpp/chain.hpp>

#include <jsonrev-cpp/diff.hpp>
#include <jsonrev-cpp/error.hpp>
#include <jsonrev-cpp/patch.hpp>

#include "executor.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>

namespace jsonrev_cpp {

namespace {

auto describe(std::string_view config_id, std::uint64_t version) -> std::string {
    return "version " + std::to_string(version) + " of '" + std::string{config_id} + "'";
}

// Replay edits onto a document, reporting a failure as chain corruption.
void replay(Value& document, const Revision& rev, std::string_view config_id) {
    try {
        apply_in_place(document, rev.edits);
    } catch (const Exception& e) {
        throw Exception{ErrorKind::corrupt_revision,
                        "cannot replay " + describe(config_id, rev.version) + ": " + e.what()};
    }
}

}  // anonymous namespace

ChainManager::ChainManager(std::shared_ptr<RevisionStore> store, ChainOptions options)
    : store_{std::move(store)}, options_{std::move(options)} {
    if (!store_) {
        throw std::invalid_argument{"ChainManager needs a revision store"};
    }
}

// -- Mutation -----------------------------------------------------------------

auto ChainManager::commit(std::string_view config_id, const Value& candidate,
                          std::string_view author) -> Revision {
    validate(candidate);

    auto head = store_->load_head(config_id);
    auto expected = head ? head->version : std::uint64_t{0};

    auto rev = Revision{};
    rev.version = expected + 1;
    rev.author = std::string{author};
    rev.timestamp = now();

    if (head) {
        auto base = head->document ? std::move(*head->document)
                                   : reconstruct(config_id, head->version);
        rev.edits = diff(base, candidate);
        auto stores_document = keeps_document(rev.version);
        if (!stores_document) {
            // Objects diff without regard to member order; a reordered
            // candidate must be stored whole to reconstruct exactly.
            stores_document = apply_edits(base, rev.edits) != candidate;
        }
        if (stores_document) rev.document = candidate;
    } else {
        rev.document = candidate;
    }

    if (store_->append_revision(config_id, expected, rev) == AppendResult::version_conflict) {
        throw Exception{ErrorKind::concurrent_modification,
                        "head of '" + std::string{config_id} + "' moved past version " +
                        std::to_string(expected) + "; reload and retry"};
    }

    if (!rev.document) rev.document = candidate;
    return rev;
}

auto ChainManager::rollback(std::string_view config_id, std::uint64_t to_version,
                            std::string_view author) -> Revision {
    auto document = reconstruct(config_id, to_version);
    return commit(config_id, document, author);
}

// -- Queries ------------------------------------------------------------------

auto ChainManager::reconstruct(std::string_view config_id, std::uint64_t version) const
    -> Value {
    auto head = require_head(config_id);
    if (version == 0 || version > head) {
        throw Exception{ErrorKind::version_not_found,
                        describe(config_id, version) + " does not exist (head is " +
                        std::to_string(head) + ")"};
    }

    // Walk back to the nearest snapshot, then play forward.
    auto pending = std::vector<Revision>{};
    auto current = load(config_id, version);
    while (!current.document) {
        if (current.version == 1) {
            throw Exception{ErrorKind::corrupt_revision,
                            describe(config_id, 1) + " carries no document"};
        }
        auto previous = load(config_id, current.version - 1);
        pending.push_back(std::move(current));
        current = std::move(previous);
    }

    auto document = std::move(*current.document);
    for (auto it = pending.rbegin(); it != pending.rend(); ++it) {
        replay(document, *it, config_id);
    }
    return document;
}

auto ChainManager::diff_between(std::string_view config_id, std::uint64_t from,
                                std::uint64_t to) const -> EditScript {
    auto head = require_head(config_id);
    for (auto v : {from, to}) {
        if (v == 0 || v > head) {
            throw Exception{ErrorKind::version_not_found,
                            describe(config_id, v) + " does not exist (head is " +
                            std::to_string(head) + ")"};
        }
    }
    if (from == to) return {};
    if (to == from + 1) return load(config_id, to).edits;
    return diff(reconstruct(config_id, from), reconstruct(config_id, to));
}

auto ChainManager::head_version(std::string_view config_id) const
    -> std::optional<std::uint64_t> {
    auto head = store_->versions(config_id);
    if (head == 0) return std::nullopt;
    return head;
}

auto ChainManager::revision(std::string_view config_id, std::uint64_t version) const
    -> Revision {
    auto head = require_head(config_id);
    if (version == 0 || version > head) {
        throw Exception{ErrorKind::version_not_found,
                        describe(config_id, version) + " does not exist"};
    }
    auto rev = load(config_id, version);
    if (!rev.document) rev.document = reconstruct(config_id, version);
    return rev;
}

auto ChainManager::history(std::string_view config_id) const -> std::vector<RevisionInfo> {
    auto head = store_->versions(config_id);
    auto result = std::vector<RevisionInfo>{};
    result.reserve(head);
    for (std::uint64_t v = 1; v <= head; ++v) {
        result.push_back(info(load(config_id, v)));
    }
    return result;
}

auto ChainManager::verify(std::string_view config_id) const -> VerifyReport {
    auto report = VerifyReport{};
    report.head_version = store_->versions(config_id);

    auto revisions = std::vector<std::optional<Revision>>(report.head_version);
    for (std::uint64_t v = 1; v <= report.head_version; ++v) {
        try {
            revisions[v - 1] = store_->load_revision(config_id, v);
        } catch (const Exception& e) {
            if (e.kind() != ErrorKind::corrupt_revision) throw;
        }
        if (!revisions[v - 1]) report.missing_versions.push_back(v);
    }

    auto segment_starts = std::vector<std::size_t>{};
    for (std::size_t i = 0; i < revisions.size(); ++i) {
        if (revisions[i] && revisions[i]->is_snapshot()) {
            ++report.snapshots;
            segment_starts.push_back(i);
        }
    }

    if (!revisions.empty() && revisions.front()) {
        const auto& first = *revisions.front();
        if (!first.is_snapshot() || !first.edits.empty()) {
            report.mismatched_versions.push_back(1);
        }
    }

    // Each segment replays from one snapshot up to and including the next.
    // Edits ignore object member order, so stored documents are compared
    // with equivalent().
    auto findings = std::vector<std::vector<std::uint64_t>>(segment_starts.size());
    detail::parallel_for(segment_starts.size(), [&](std::size_t s) {
        auto begin = segment_starts[s];
        auto end = s + 1 < segment_starts.size() ? segment_starts[s + 1] : revisions.size() - 1;
        auto document = *revisions[begin]->document;
        for (auto i = begin + 1; i <= end; ++i) {
            const auto& rev = revisions[i];
            if (!rev) return;
            try {
                apply_in_place(document, rev->edits);
            } catch (const Exception&) {
                findings[s].push_back(rev->version);
                return;
            }
            if (rev->document && !equivalent(*rev->document, document)) {
                findings[s].push_back(rev->version);
            }
        }
    });

    for (const auto& found : findings) {
        report.mismatched_versions.insert(report.mismatched_versions.end(),
                                          found.begin(), found.end());
    }
    std::ranges::sort(report.mismatched_versions);
    auto [first_dup, last_dup] = std::ranges::unique(report.mismatched_versions);
    report.mismatched_versions.erase(first_dup, last_dup);
    return report;
}

// -- Internals ----------------------------------------------------------------

auto ChainManager::load(std::string_view config_id, std::uint64_t version) const
    -> Revision {
    auto rev = store_->load_revision(config_id, version);
    if (!rev) {
        throw Exception{ErrorKind::corrupt_revision,
                        describe(config_id, version) + " is missing from the store"};
    }
    return std::move(*rev);
}

auto ChainManager::require_head(std::string_view config_id) const -> std::uint64_t {
    auto head = store_->versions(config_id);
    if (head == 0) {
        throw Exception{ErrorKind::version_not_found,
                        "'" + std::string{config_id} + "' has no revisions"};
    }
    return head;
}

auto ChainManager::keeps_document(std::uint64_t version) const noexcept -> bool {
    if (options_.mode == StorageMode::full_documents) return true;
    if (version == 1) return true;
    return options_.snapshot_interval != 0 && version % options_.snapshot_interval == 0;
}

auto ChainManager::now() const -> std::int64_t {
    if (options_.clock) return options_.clock();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace jsonrev_cpp
