#include <ledgersync/date.hpp>
#include <ledgersync/ledger.hpp>
#include <ledgersync/memory_store.hpp>

#include <gtest/gtest.h>

using namespace ledgersync;

// -- Dates --------------------------------------------------------------------

TEST(DateInt, encodes_and_decodes_calendar_days) {
    using namespace std::chrono;
    auto ymd = year_month_day{year{2024}, month{2}, day{29}};

    EXPECT_EQ(to_date_int(ymd), 20240229);
    EXPECT_EQ(from_date_int(20240229), ymd);
}

TEST(DateInt, day_arithmetic_crosses_month_and_year) {
    EXPECT_EQ(add_days(20240228, 1), 20240229);
    EXPECT_EQ(add_days(20240301, -1), 20240229);
    EXPECT_EQ(add_days(20231231, 1), 20240101);
    EXPECT_EQ(days_between(20231225, 20240101), 7);
    EXPECT_EQ(days_between(20240101, 20231225), -7);
}

TEST(DateInt, today_is_a_valid_day) {
    EXPECT_TRUE(from_date_int(today()).ok());
}

// -- Ledger -------------------------------------------------------------------

class LedgerTest : public ::testing::Test {
protected:
    MemoryStore store_;
    ChangeBuffer buffer_;
    Ledger ledger_{store_, buffer_};
};

TEST_F(LedgerTest, reads_see_buffered_writes) {
    store_.get_or_create("payees", "p1");
    store_.update("payees", "p1", {{"name", std::string{"Old"}}});
    ledger_.update("payees", "p1", {{"name", std::string{"New"}}});
    ledger_.update("payees", "p2", {{"name", std::string{"Other"}}});

    EXPECT_EQ(ledger_.get("payees", "p1")->get("name"), ScalarValue{std::string{"New"}});
    EXPECT_EQ(store_.get("payees", "p1")->get("name"), ScalarValue{std::string{"Old"}});

    auto payees = ledger_.select("payees");
    ASSERT_EQ(payees.size(), 2u);
    EXPECT_EQ(payees[0].id, "p1");
    EXPECT_EQ(payees[1].id, "p2");
    EXPECT_FALSE(ledger_.get("payees", "p3").has_value());
}

TEST_F(LedgerTest, get_or_create_payee_is_idempotent_and_maps_itself) {
    auto first = ledger_.get_or_create_payee("Cafe");
    auto second = ledger_.get_or_create_payee("Cafe");

    EXPECT_EQ(first.id, second.id);
    auto mapping = ledger_.get("payee_mapping", first.id);
    ASSERT_TRUE(mapping.has_value());
    EXPECT_EQ(mapping->get("targetId"), ScalarValue{first.id});
    EXPECT_EQ(ledger_.select("payees").size(), 1u);
}

TEST_F(LedgerTest, deleted_payees_are_not_found) {
    auto payee = ledger_.get_or_create_payee("Cafe");
    ledger_.update("payees", payee.id, {{"tombstone", true}});

    EXPECT_FALSE(ledger_.find_payee("Cafe").has_value());
    EXPECT_NE(ledger_.get_or_create_payee("Cafe").id, payee.id);
}

TEST_F(LedgerTest, category_is_created_with_its_group) {
    auto category = ledger_.get_or_create_category("Starting Balances", "Income", true);
    auto group_id = get_scalar<std::string>(category.get("cat_group"));

    ASSERT_TRUE(group_id.has_value());
    auto group = ledger_.get("category_groups", *group_id);
    ASSERT_TRUE(group.has_value());
    EXPECT_EQ(group->get("name"), ScalarValue{std::string{"Income"}});
    EXPECT_EQ(ledger_.get_or_create_category("Starting Balances", "Income", true).id,
              category.id);
}

TEST_F(LedgerTest, transactions_are_newest_first_and_skip_deleted) {
    auto account = ledger_.create_account("Checking");
    auto other = ledger_.create_account("Savings", true);
    ledger_.create_transaction({.account_id = account.id, .date = 20240101, .amount = 1});
    auto deleted = ledger_.create_transaction(
        {.account_id = account.id, .date = 20240102, .amount = 2});
    ledger_.create_transaction({.account_id = account.id, .date = 20240103, .amount = 3});
    ledger_.create_transaction({.account_id = other.id, .date = 20240104, .amount = 4});
    ledger_.update("transactions", deleted.id, {{"tombstone", true}});

    auto txns = ledger_.transactions(account.id);
    ASSERT_EQ(txns.size(), 2u);
    EXPECT_EQ(txns[0].get("date"), ScalarValue{std::int64_t{20240103}});
    EXPECT_EQ(txns[1].get("date"), ScalarValue{std::int64_t{20240101}});
}

TEST_F(LedgerTest, create_transaction_writes_optional_fields_only_when_set) {
    auto account = ledger_.create_account("Checking");
    auto plain = ledger_.create_transaction({.account_id = account.id, .date = 20240101});
    auto imported = ledger_.create_transaction({
        .account_id = account.id,
        .date = 20240101,
        .amount = -1200,
        .financial_id = std::string{"bank-1"},
        .imported_description = std::string{"CAFE 123"},
    });

    EXPECT_FALSE(plain.get("financial_id").has_value());
    EXPECT_FALSE(plain.get("description").has_value());
    EXPECT_EQ(imported.get("financial_id"), ScalarValue{std::string{"bank-1"}});
    EXPECT_EQ(imported.get("imported_description"), ScalarValue{std::string{"CAFE 123"}});
    EXPECT_EQ(imported.get("acct"), ScalarValue{account.id});
}
