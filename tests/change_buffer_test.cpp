#include <ledgersync/change_buffer.hpp>
#include <ledgersync/error.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace ledgersync;
using namespace ledgersync::testing;

class ChangeBufferTest : public ::testing::Test {
protected:
    FakeWallClock wall_;
    LogicalClock clock_{make_replica_clock(client_a), wall_.source()};
    ChangeBuffer buffer_;
};

TEST_F(ChangeBufferTest, new_buffer_is_empty) {
    EXPECT_TRUE(buffer_.empty());
    EXPECT_TRUE(buffer_.flush(clock_).empty());
}

TEST_F(ChangeBufferTest, flush_preserves_write_order_with_increasing_timestamps) {
    buffer_.record("transactions", "t1", "amount", std::int64_t{-1200});
    buffer_.record("payees", "p1", "name", std::string{"Cafe"});
    buffer_.record("transactions", "t1", "description", std::string{"p1"});

    auto records = buffer_.flush(clock_);

    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].column, "amount");
    EXPECT_EQ(records[1].dataset, "payees");
    EXPECT_EQ(records[2].column, "description");
    EXPECT_LT(records[0].timestamp, records[1].timestamp);
    EXPECT_LT(records[1].timestamp, records[2].timestamp);
    EXPECT_EQ(records[0].timestamp.client_id, client_a);
}

TEST_F(ChangeBufferTest, repeated_writes_coalesce_in_place) {
    buffer_.record("transactions", "t1", "amount", std::int64_t{100});
    buffer_.record("transactions", "t1", "notes", std::string{"first"});
    buffer_.record("transactions", "t1", "amount", std::int64_t{200});

    EXPECT_EQ(buffer_.size(), 2u);
    auto records = buffer_.flush(clock_);

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].column, "amount");
    EXPECT_EQ(records[0].value, ScalarValue{std::int64_t{200}});
    EXPECT_EQ(records[1].column, "notes");
}

TEST_F(ChangeBufferTest, flush_clears_the_buffer) {
    buffer_.record("transactions", "t1", "amount", std::int64_t{1});
    buffer_.flush(clock_);

    EXPECT_TRUE(buffer_.empty());
    EXPECT_TRUE(buffer_.flush(clock_).empty());
}

TEST_F(ChangeBufferTest, no_timestamp_is_issued_before_flush) {
    buffer_.record("transactions", "t1", "amount", std::int64_t{1});
    EXPECT_EQ(clock_.state().last.millis, 0u);
}

TEST_F(ChangeBufferTest, record_entity_buffers_every_attribute) {
    buffer_.record_entity("payees", "p1", {{"name", std::string{"Cafe"}}, {"tombstone", false}});
    auto records = buffer_.flush(clock_);

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].column, "name");
    EXPECT_EQ(records[1].column, "tombstone");
}

TEST_F(ChangeBufferTest, discard_drops_pending_writes) {
    buffer_.record("transactions", "t1", "amount", std::int64_t{1});
    buffer_.discard();

    EXPECT_TRUE(buffer_.empty());
    EXPECT_TRUE(buffer_.flush(clock_).empty());
}

TEST_F(ChangeBufferTest, flush_inside_transaction_is_refused) {
    buffer_.begin_transaction();
    buffer_.record("transactions", "t1", "amount", std::int64_t{1});

    try {
        buffer_.flush(clock_);
        FAIL() << "flush inside a transaction succeeded";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_operation);
    }
    EXPECT_EQ(buffer_.size(), 1u);

    buffer_.end_transaction();
    EXPECT_EQ(buffer_.flush(clock_).size(), 1u);
}

TEST_F(ChangeBufferTest, transactions_nest) {
    buffer_.begin_transaction();
    buffer_.begin_transaction();
    buffer_.end_transaction();
    EXPECT_TRUE(buffer_.in_transaction());
    buffer_.end_transaction();
    EXPECT_FALSE(buffer_.in_transaction());
    EXPECT_THROW(buffer_.end_transaction(), Error);
}

TEST_F(ChangeBufferTest, pending_reads_reflect_latest_values) {
    buffer_.record("transactions", "t1", "amount", std::int64_t{1});
    buffer_.record("transactions", "t2", "amount", std::int64_t{2});
    buffer_.record("transactions", "t1", "amount", std::int64_t{3});

    auto attributes = buffer_.pending_attributes("transactions", "t1");
    EXPECT_EQ(attributes.at("amount"), ScalarValue{std::int64_t{3}});
    EXPECT_EQ(buffer_.pending_rows("transactions"), (std::vector<std::string>{"t1", "t2"}));
    EXPECT_TRUE(buffer_.pending_rows("payees").empty());
}
