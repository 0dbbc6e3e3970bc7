#include <jsonrev-cpp/chain.hpp>
#include <jsonrev-cpp/error.hpp>
#include <jsonrev-cpp/json.hpp>
#include <jsonrev-cpp/store.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace jsonrev_cpp;

namespace {

auto revision_at(std::uint64_t version, Value document) -> Revision {
    auto rev = Revision{};
    rev.version = version;
    rev.document = std::move(document);
    rev.author = "test";
    rev.timestamp = 42;
    return rev;
}

// Commit with the caller-driven retry loop; returns the number of attempts.
auto commit_with_retry(ChainManager& chain, const std::string& id, const Value& doc,
                       const std::string& author) -> int {
    for (auto attempts = 1;; ++attempts) {
        try {
            chain.commit(id, doc, author);
            return attempts;
        } catch (const Exception& e) {
            if (!e.retryable()) throw;
        }
    }
}

}  // namespace

// -- MemoryRevisionStore --------------------------------------------------------

TEST(MemoryRevisionStore, empty_store) {
    auto store = MemoryRevisionStore{};
    EXPECT_FALSE(store.load_head("gw").has_value());
    EXPECT_FALSE(store.load_revision("gw", 1).has_value());
    EXPECT_EQ(store.versions("gw"), 0u);
    EXPECT_EQ(store.stored_bytes("gw"), 0u);
    EXPECT_TRUE(store.config_ids().empty());
}

TEST(MemoryRevisionStore, append_then_load) {
    auto store = MemoryRevisionStore{};
    const auto rev = revision_at(1, parse(R"({"x":[1.50,"y"]})"));
    ASSERT_EQ(store.append_revision("gw", 0, rev), AppendResult::appended);

    EXPECT_EQ(store.versions("gw"), 1u);
    EXPECT_EQ(store.load_head("gw"), rev);
    EXPECT_EQ(store.load_revision("gw", 1), rev);
    EXPECT_FALSE(store.load_revision("gw", 2).has_value());
    EXPECT_FALSE(store.load_revision("gw", 0).has_value());
    EXPECT_GT(store.stored_bytes("gw"), 0u);
}

TEST(MemoryRevisionStore, stale_expected_version_conflicts) {
    auto store = MemoryRevisionStore{};
    ASSERT_EQ(store.append_revision("gw", 0, revision_at(1, Value{1})), AppendResult::appended);
    ASSERT_EQ(store.append_revision("gw", 1, revision_at(2, Value{2})), AppendResult::appended);

    EXPECT_EQ(store.append_revision("gw", 1, revision_at(2, Value{3})),
              AppendResult::version_conflict);
    EXPECT_EQ(store.append_revision("gw", 0, revision_at(1, Value{3})),
              AppendResult::version_conflict);
    EXPECT_EQ(store.versions("gw"), 2u);
    EXPECT_EQ(store.load_head("gw")->document, Value{2});
}

TEST(MemoryRevisionStore, mismatched_revision_number_is_rejected) {
    auto store = MemoryRevisionStore{};
    try {
        static_cast<void>(store.append_revision("gw", 0, revision_at(2, Value{})));
        FAIL() << "expected corrupt_revision";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::corrupt_revision);
    }
    EXPECT_EQ(store.versions("gw"), 0u);
}

TEST(MemoryRevisionStore, loads_are_independent_copies) {
    auto store = MemoryRevisionStore{};
    store.append_revision("gw", 0, revision_at(1, parse(R"({"a":1})")));

    auto first = store.load_revision("gw", 1);
    first->document = parse(R"({"a":2})");
    EXPECT_EQ(store.load_revision("gw", 1)->document, parse(R"({"a":1})"));
}

TEST(MemoryRevisionStore, corrupted_blob_throws_on_load) {
    auto store = MemoryRevisionStore{};
    store.append_revision("gw", 0, revision_at(1, Value{1}));
    store.replace_blob("gw", 1, {std::byte{0x4A}, std::byte{0x52}});

    try {
        static_cast<void>(store.load_revision("gw", 1));
        FAIL() << "expected corrupt_revision";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::corrupt_revision);
    }
}

TEST(MemoryRevisionStore, replace_blob_requires_stored_version) {
    auto store = MemoryRevisionStore{};
    EXPECT_THROW(store.replace_blob("gw", 1, {}), Exception);
    store.append_revision("gw", 0, revision_at(1, Value{1}));
    EXPECT_THROW(store.replace_blob("gw", 2, {}), Exception);
}

TEST(MemoryRevisionStore, config_ids_are_sorted) {
    auto store = MemoryRevisionStore{};
    for (auto id : {"zeta", "alpha", "mid"}) {
        store.append_revision(id, 0, revision_at(1, Value{}));
    }
    EXPECT_EQ(store.config_ids(), (std::vector<std::string>{"alpha", "mid", "zeta"}));
}

// -- Concurrent commits -----------------------------------------------------------

TEST(ConcurrentCommit, racing_writers_keep_chain_gapless) {
    auto store = std::make_shared<MemoryRevisionStore>();
    auto setup = ChainManager{store};
    for (int i = 1; i <= 5; ++i) setup.commit("gw", Value{Object{{"seed", i}}}, "setup");

    constexpr int writers = 4;
    constexpr int commits_per_writer = 25;
    auto conflicts = std::atomic<int>{0};

    auto threads = std::vector<std::thread>{};
    for (int w = 0; w < writers; ++w) {
        threads.emplace_back([&, w] {
            auto chain = ChainManager{store};
            for (int i = 0; i < commits_per_writer; ++i) {
                auto doc = Value{Object{{"writer", w}, {"step", i}}};
                conflicts += commit_with_retry(chain, "gw", doc, "w" + std::to_string(w)) - 1;
            }
        });
    }
    for (auto& t : threads) t.join();

    auto chain = ChainManager{store};
    const auto expected_head = std::uint64_t{5 + writers * commits_per_writer};
    EXPECT_EQ(chain.head_version("gw"), expected_head);

    auto seen = std::set<std::uint64_t>{};
    for (const auto& entry : chain.history("gw")) seen.insert(entry.version);
    EXPECT_EQ(seen.size(), expected_head);
    EXPECT_EQ(*seen.begin(), 1u);
    EXPECT_EQ(*seen.rbegin(), expected_head);

    EXPECT_TRUE(chain.verify("gw").ok());
    EXPECT_GE(conflicts.load(), 0);
}

TEST(ConcurrentCommit, different_configs_never_conflict) {
    auto store = std::make_shared<MemoryRevisionStore>();
    constexpr int configs = 4;
    constexpr int commits = 30;
    auto conflicts = std::atomic<int>{0};

    auto threads = std::vector<std::thread>{};
    for (int c = 0; c < configs; ++c) {
        threads.emplace_back([&, c] {
            auto chain = ChainManager{store};
            auto id = "cfg-" + std::to_string(c);
            for (int i = 0; i < commits; ++i) {
                conflicts += commit_with_retry(chain, id, Value{Array{i}}, "w") - 1;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(conflicts.load(), 0);
    EXPECT_EQ(store->config_ids().size(), static_cast<std::size_t>(configs));
    for (int c = 0; c < configs; ++c) {
        EXPECT_EQ(store->versions("cfg-" + std::to_string(c)), static_cast<std::uint64_t>(commits));
    }
}

TEST(ConcurrentCommit, readers_see_consistent_versions) {
    auto store = std::make_shared<MemoryRevisionStore>();
    auto writer = ChainManager{store};
    writer.commit("gw", Value{Array{0}}, "w");

    auto done = std::atomic<bool>{false};
    auto reader = std::thread{[&] {
        auto chain = ChainManager{store};
        while (!done.load()) {
            auto head = chain.head_version("gw").value_or(0);
            if (head == 0) continue;
            auto doc = chain.reconstruct("gw", head);
            ASSERT_EQ(doc.get_if<Array>()->size(), 1u);
        }
    }};
    for (int i = 1; i <= 50; ++i) writer.commit("gw", Value{Array{i}}, "w");
    done = true;
    reader.join();

    EXPECT_EQ(writer.reconstruct("gw", 51), Value{Array{50}});
}
