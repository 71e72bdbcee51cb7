#include <ledgersync/error.hpp>
#include <ledgersync/memory_store.hpp>
#include <ledgersync/sync_session.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <stop_token>

using namespace ledgersync;
using namespace ledgersync::testing;

namespace {

constexpr auto group_id = "group-1";

/// One replica: its store, metadata, buffer and session. The session is
/// built after the store is seeded with a clock for a known client.
struct Replica {
    Replica(const ClientId& id, InMemoryRelay& relay)
        : relay_{relay}, metadata{nlohmann::json{{"cloudFileId", "file-1"}}} {
        store.save_clock(make_replica_clock(id));
        restart();
    }

    // Rebuild the session from what the stores hold, as a fresh process would.
    void restart() {
        session.reset();
        session.emplace(store, store, metadata, relay_, ledger_schema(), wall.source());
    }

    auto amount(std::string_view row) const -> std::optional<std::int64_t> {
        auto entity = store.get("transactions", row);
        if (!entity) return std::nullopt;
        return get_scalar<std::int64_t>(entity->get("amount"));
    }

    InMemoryRelay& relay_;
    FakeWallClock wall{.step = 1};
    MemoryStore store;
    MemoryMetadataStore metadata;
    ChangeBuffer buffer;
    std::optional<SyncSession> session;
};

}  // anonymous namespace

class SyncSessionTest : public ::testing::Test {
protected:
    void join_both() {
        a_.session->register_group(group_id);
        b_.session->register_group(group_id);
    }

    InMemoryRelay relay_;
    InMemoryKeyRegistry keys_;
    Replica a_{client_a, relay_};
    Replica b_{client_b, relay_};
};

// -- Round trips --------------------------------------------------------------

TEST_F(SyncSessionTest, two_replicas_converge) {
    join_both();

    a_.buffer.record("transactions", "T1", "amount", std::int64_t{-1200});
    a_.session->sync(a_.buffer);
    auto stats = b_.session->sync();

    EXPECT_EQ(stats.applied, 1u);
    EXPECT_EQ(b_.amount("T1"), -1200);

    b_.buffer.record("transactions", "T1", "amount", std::int64_t{500});
    b_.session->sync(b_.buffer);
    a_.session->sync();

    EXPECT_EQ(a_.amount("T1"), 500);
    EXPECT_EQ(b_.amount("T1"), 500);
    EXPECT_EQ(a_.session->state(), SyncState::idle);
    EXPECT_EQ(b_.session->state(), SyncState::idle);
}

TEST_F(SyncSessionTest, redelivered_records_are_skipped) {
    join_both();
    a_.buffer.record("transactions", "T1", "amount", std::int64_t{-1200});
    a_.buffer.record("transactions", "T1", "notes", std::string{"lunch"});
    a_.session->commit(a_.buffer);

    auto first = b_.session->sync();
    auto row = b_.store.get("transactions", "T1");
    auto messages = b_.store.message_count();
    auto second = b_.session->sync();

    EXPECT_EQ(first, (ApplyStats{.applied = 2, .skipped = 0, .prefs = 0}));
    EXPECT_EQ(second, (ApplyStats{.applied = 0, .skipped = 2, .prefs = 0}));
    EXPECT_EQ(b_.store.get("transactions", "T1"), row);
    EXPECT_EQ(b_.store.message_count(), messages);
}

TEST_F(SyncSessionTest, commit_applies_locally_and_sends) {
    a_.session->register_group(group_id);
    a_.buffer.record("transactions", "T1", "amount", std::int64_t{-1200});

    auto records = a_.session->commit(a_.buffer);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_TRUE(a_.buffer.empty());
    EXPECT_EQ(a_.amount("T1"), -1200);
    ASSERT_EQ(relay_.entries.size(), 1u);
    EXPECT_EQ(relay_.entries[0].group_id, group_id);
    EXPECT_EQ(relay_.entries[0].sender, client_a);
    EXPECT_FALSE(relay_.entries[0].payload.meta.has_value());
    EXPECT_EQ(a_.store.load_clock()->last, records[0].timestamp);
    EXPECT_TRUE(a_.store.pending_outgoing().empty());
}

TEST_F(SyncSessionTest, committing_an_empty_buffer_sends_nothing) {
    a_.session->register_group(group_id);
    EXPECT_TRUE(a_.session->commit(a_.buffer).empty());
    EXPECT_TRUE(relay_.entries.empty());
}

TEST_F(SyncSessionTest, without_a_group_changes_stay_local) {
    a_.buffer.record("transactions", "T1", "amount", std::int64_t{-1200});
    a_.session->sync(a_.buffer);

    EXPECT_EQ(a_.amount("T1"), -1200);
    EXPECT_TRUE(relay_.entries.empty());
    EXPECT_TRUE(relay_.fetch_cursors.empty());
    EXPECT_TRUE(a_.store.pending_outgoing().empty());
    EXPECT_EQ(a_.session->state(), SyncState::idle);
}

TEST_F(SyncSessionTest, group_id_is_stored_in_metadata) {
    a_.session->register_group(group_id);
    EXPECT_EQ(a_.metadata.get()["groupId"], group_id);

    a_.restart();
    EXPECT_EQ(a_.session->config().group_id, std::optional<std::string>{group_id});
}

TEST_F(SyncSessionTest, preferences_replicate_to_metadata) {
    join_both();
    a_.buffer.record("prefs", "budgetName", "value", std::string{"Household"});
    a_.session->sync(a_.buffer);
    auto stats = b_.session->sync();

    EXPECT_EQ(stats.prefs, 1u);
    EXPECT_EQ(a_.metadata.get()["budgetName"], "Household");
    EXPECT_EQ(b_.metadata.get()["budgetName"], "Household");
}

// -- Phases -------------------------------------------------------------------

TEST_F(SyncSessionTest, clock_is_persisted_only_after_apply) {
    join_both();
    a_.buffer.record("transactions", "T1", "amount", std::int64_t{-1200});
    a_.session->commit(a_.buffer);

    auto before = b_.store.load_clock();
    auto batch = b_.session->receive();

    EXPECT_EQ(b_.session->state(), SyncState::awaiting_remote);
    ASSERT_EQ(batch.records.size(), 1u);
    ASSERT_TRUE(batch.max_timestamp.has_value());
    EXPECT_EQ(b_.store.load_clock(), before);
    EXPECT_FALSE(b_.amount("T1").has_value());

    b_.session->apply(batch);

    EXPECT_EQ(b_.session->state(), SyncState::idle);
    EXPECT_GT(b_.store.load_clock()->last, *batch.max_timestamp);
    EXPECT_EQ(b_.store.load_clock()->client_id, client_b);
}

TEST_F(SyncSessionTest, received_records_are_sorted_by_timestamp) {
    auto c = Replica{client_c, relay_};
    join_both();
    c.session->register_group(group_id);

    a_.buffer.record("transactions", "T1", "amount", std::int64_t{1});
    a_.session->commit(a_.buffer);
    c.session->sync();
    c.buffer.record("transactions", "T1", "amount", std::int64_t{2});
    c.session->commit(c.buffer);

    auto batch = b_.session->receive();
    ASSERT_EQ(batch.records.size(), 2u);
    EXPECT_LT(batch.records[0].timestamp, batch.records[1].timestamp);
    b_.session->apply(batch);
    EXPECT_EQ(b_.amount("T1"), 2);
}

TEST_F(SyncSessionTest, abandon_before_apply_changes_nothing) {
    join_both();
    a_.buffer.record("transactions", "T1", "amount", std::int64_t{-1200});
    a_.session->commit(a_.buffer);

    auto before = b_.store.load_clock();
    auto batch = b_.session->receive();
    b_.session->abandon();

    EXPECT_EQ(b_.session->state(), SyncState::idle);
    EXPECT_FALSE(b_.amount("T1").has_value());
    EXPECT_EQ(b_.store.load_clock(), before);
    EXPECT_THROW(b_.session->apply(batch), Error);

    b_.session->sync();
    EXPECT_EQ(b_.amount("T1"), -1200);
}

TEST_F(SyncSessionTest, stop_request_skips_the_round) {
    join_both();
    a_.buffer.record("transactions", "T1", "amount", std::int64_t{-1200});
    a_.session->commit(a_.buffer);

    auto source = std::stop_source{};
    source.request_stop();
    auto stats = b_.session->sync(source.get_token());

    EXPECT_EQ(stats, ApplyStats{});
    EXPECT_TRUE(relay_.fetch_cursors.empty());
    EXPECT_EQ(b_.session->state(), SyncState::idle);
    EXPECT_FALSE(b_.amount("T1").has_value());
}

TEST_F(SyncSessionTest, phases_out_of_order_are_rejected) {
    EXPECT_THROW(a_.session->apply(RemoteBatch{}), Error);
    EXPECT_THROW(a_.session->reset(), Error);

    a_.session->receive();
    EXPECT_THROW(a_.session->receive(), Error);
    EXPECT_THROW(a_.session->commit(a_.buffer), Error);
    a_.session->abandon();
    EXPECT_EQ(a_.session->state(), SyncState::idle);
}

// -- Failures -----------------------------------------------------------------

TEST_F(SyncSessionTest, fetch_failure_enters_error_until_reset) {
    join_both();
    relay_.fail_fetches = true;

    EXPECT_THROW(a_.session->sync(), TransportError);
    EXPECT_EQ(a_.session->state(), SyncState::error);
    EXPECT_THROW(a_.session->commit(a_.buffer), Error);
    EXPECT_THROW(a_.session->abandon(), Error);

    a_.session->reset();
    relay_.fail_fetches = false;
    EXPECT_NO_THROW(a_.session->sync());
    EXPECT_EQ(a_.session->state(), SyncState::idle);
}

TEST_F(SyncSessionTest, send_failure_keeps_the_commit_queued) {
    join_both();
    relay_.fail_sends = true;
    a_.buffer.record("transactions", "T1", "amount", std::int64_t{-1200});

    EXPECT_THROW(a_.session->commit(a_.buffer), TransportError);

    EXPECT_EQ(a_.session->state(), SyncState::error);
    EXPECT_EQ(a_.amount("T1"), -1200);
    EXPECT_TRUE(a_.buffer.empty());
    EXPECT_EQ(a_.store.pending_outgoing().size(), 1u);

    a_.session->reset();
    relay_.fail_sends = false;
    a_.buffer.record("transactions", "T2", "amount", std::int64_t{300});
    a_.session->sync(a_.buffer);
    b_.session->sync();

    EXPECT_TRUE(a_.store.pending_outgoing().empty());
    EXPECT_EQ(b_.amount("T1"), -1200);
    EXPECT_EQ(b_.amount("T2"), 300);
}

TEST_F(SyncSessionTest, queued_records_are_sent_by_the_next_round) {
    join_both();
    relay_.fail_sends = true;
    a_.buffer.record("transactions", "T1", "amount", std::int64_t{-1200});
    EXPECT_THROW(a_.session->commit(a_.buffer), TransportError);

    // A fresh session over the same store still owes the relay T1.
    a_.restart();
    relay_.fail_sends = false;
    a_.session->sync();
    b_.session->sync();

    EXPECT_TRUE(a_.store.pending_outgoing().empty());
    EXPECT_EQ(b_.amount("T1"), -1200);
}

TEST_F(SyncSessionTest, send_without_queued_records_is_a_no_op) {
    a_.session->register_group(group_id);
    EXPECT_EQ(a_.session->send(), 0u);
    EXPECT_TRUE(relay_.entries.empty());
    EXPECT_EQ(a_.session->state(), SyncState::idle);
}

TEST_F(SyncSessionTest, corrupt_payload_after_a_good_one_applies_nothing) {
    join_both();
    a_.buffer.record("transactions", "T1", "amount", std::int64_t{-1200});
    a_.session->commit(a_.buffer);

    auto corrupt = relay_.entries.back();
    corrupt.sender = client_c;
    corrupt.payload.content.back() ^= std::byte{0xFF};
    relay_.entries.push_back(corrupt);

    auto messages = b_.store.message_count();
    auto clock = b_.session->clock().state();
    EXPECT_THROW(b_.session->sync(), DecodeError);

    EXPECT_EQ(b_.session->state(), SyncState::error);
    EXPECT_EQ(b_.store.message_count(), messages);
    EXPECT_EQ(b_.session->clock().state(), clock);
    EXPECT_EQ(b_.store.load_clock(), std::optional<ReplicaClock>{clock});
    EXPECT_FALSE(b_.amount("T1").has_value());
}

// -- Encryption ---------------------------------------------------------------

TEST_F(SyncSessionTest, encrypted_replicas_converge) {
    join_both();
    a_.session->enable_encryption("hunter2", keys_);
    ASSERT_TRUE(a_.session->config().key_id.has_value());
    EXPECT_EQ(keys_.keys.at("file-1").key_id, *a_.session->config().key_id);
    EXPECT_EQ(a_.metadata.get()["encryptKeyId"], *a_.session->config().key_id);

    b_.metadata.patch(nlohmann::json{{"encryptKeyId", *a_.session->config().key_id}});
    b_.restart();
    b_.session->enable_encryption("hunter2", keys_);
    EXPECT_TRUE(b_.session->encrypted());

    a_.buffer.record("transactions", "T1", "amount", std::int64_t{-1200});
    a_.session->commit(a_.buffer);
    ASSERT_EQ(relay_.entries.size(), 1u);
    EXPECT_TRUE(relay_.entries[0].payload.meta.has_value());
    EXPECT_EQ(relay_.entries[0].key_id, a_.session->config().key_id);

    b_.session->sync();
    EXPECT_EQ(b_.amount("T1"), -1200);
}

TEST_F(SyncSessionTest, wrong_password_is_rejected) {
    a_.session->enable_encryption("hunter2", keys_);
    a_.restart();

    EXPECT_THROW(a_.session->enable_encryption("hunter3", keys_), KeyDerivationError);
    EXPECT_FALSE(a_.session->encrypted());
    EXPECT_NO_THROW(a_.session->enable_encryption("hunter2", keys_));
}

TEST_F(SyncSessionTest, empty_password_is_rejected) {
    EXPECT_THROW(a_.session->enable_encryption("", keys_), KeyDerivationError);
    EXPECT_TRUE(keys_.keys.empty());
}

TEST_F(SyncSessionTest, unknown_key_is_rejected) {
    a_.metadata.patch(nlohmann::json{{"encryptKeyId", "missing-key"}});
    a_.restart();
    EXPECT_THROW(a_.session->enable_encryption("hunter2", keys_), KeyDerivationError);
}

TEST_F(SyncSessionTest, encrypted_backlog_without_key_fails_the_round) {
    join_both();
    a_.session->enable_encryption("hunter2", keys_);
    a_.buffer.record("transactions", "T1", "amount", std::int64_t{-1200});
    a_.session->commit(a_.buffer);

    auto before = b_.store.load_clock();
    EXPECT_THROW(b_.session->sync(), DecryptionError);

    EXPECT_EQ(b_.session->state(), SyncState::error);
    EXPECT_FALSE(b_.amount("T1").has_value());
    EXPECT_EQ(b_.store.load_clock(), before);

    b_.session->reset();
    EXPECT_EQ(b_.session->state(), SyncState::idle);
}

TEST_F(SyncSessionTest, backlog_under_another_key_fails_the_round) {
    join_both();
    a_.session->enable_encryption("hunter2", keys_);
    a_.buffer.record("transactions", "T1", "amount", std::int64_t{-1200});
    a_.session->commit(a_.buffer);

    auto other_keys = InMemoryKeyRegistry{};
    b_.session->enable_encryption("correct horse", other_keys);

    EXPECT_THROW(b_.session->sync(), DecryptionError);
    EXPECT_EQ(b_.session->state(), SyncState::error);
    EXPECT_FALSE(b_.amount("T1").has_value());
}
