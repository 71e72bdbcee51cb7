// bank_import_demo: importing a bank feed into a ledger exactly once
//
// Demonstrates: Ledger, ReconciliationEngine, BankFeed, starting balances,
//               fuzzy matching of a manually entered transaction
//
// Build: cmake --build build
// Run:   ./build/bank_import_demo

#include <ledgersync/ledgersync.hpp>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace ls = ledgersync;

// A bank feed serving a fixed statement.
class StatementFeed : public ls::BankFeed {
public:
    explicit StatementFeed(ls::FeedResult statement) : statement_{std::move(statement)} {}

    auto fetch(const ls::Entity& account, ls::DateInt start_date) -> ls::FeedResult override {
        std::printf("  bank: fetching %s from %d\n",
                    ls::get_scalar<std::string>(account.get("name")).value_or("?").c_str(),
                    static_cast<int>(start_date));
        auto out = statement_;
        std::erase_if(out.transactions, [&](const ls::ExternalTransaction& t) {
            return t.date < start_date;
        });
        return out;
    }

private:
    ls::FeedResult statement_;
};

// Minimal relay; the ledger here never joins a group.
class NoRelay : public ls::RelayTransport {
public:
    void send_change_set(const std::string&, const std::optional<std::string>&,
                         const ls::WirePayload&) override {}
    auto fetch_backlog(const std::string&, const ls::LogicalTimestamp&)
        -> std::vector<ls::WirePayload> override {
        return {};
    }
};

static void print_results(const std::vector<ls::ReconciledTransaction>& results) {
    for (const auto& [transaction, outcome] : results) {
        std::printf("  %-9s %lld on %lld\n", std::string{ls::to_string_view(outcome)}.c_str(),
                    static_cast<long long>(
                        ls::get_scalar<std::int64_t>(transaction.get("amount")).value_or(0)),
                    static_cast<long long>(
                        ls::get_scalar<std::int64_t>(transaction.get("date")).value_or(0)));
    }
}

int main() {
    spdlog::set_level(spdlog::level::info);

    auto store = ls::MemoryStore{};
    auto metadata = ls::MemoryMetadataStore{};
    auto relay = NoRelay{};
    auto session = ls::SyncSession{store, store, metadata, relay};
    auto buffer = ls::ChangeBuffer{};
    auto ledger = ls::Ledger{store, buffer};
    auto engine = ls::ReconciliationEngine{ledger};

    auto account = ledger.create_account("Everyday Checking");

    // Entered by hand before the bank reported it.
    auto grocer = ledger.get_or_create_payee("Corner Grocer");
    ledger.create_transaction({
        .account_id = account.id,
        .date = ls::add_days(ls::today(), -3),
        .amount = -2350,
        .payee_id = grocer.id,
    });
    session.commit(buffer);

    auto feed = StatementFeed{ls::FeedResult{
        .balance = 120000,
        .transactions = {
            {.date = ls::add_days(ls::today(), -1), .payee_name = "Pending Fuel",
             .amount = -6000, .imported_id = "bank-4", .booked = false},
            {.date = ls::add_days(ls::today(), -2), .payee_name = "Corner Grocer",
             .amount = -2350, .imported_id = "bank-3"},
            {.date = ls::add_days(ls::today(), -10), .payee_name = "Payroll",
             .amount = 250000, .imported_id = "bank-2"},
            {.date = ls::add_days(ls::today(), -20), .payee_name = "Landlord",
             .amount = -150000, .imported_id = "bank-1"},
        },
    }};

    std::printf("=== First import ===\n");
    print_results(engine.sync_account(feed, account.id, ls::add_days(ls::today(), -30)));
    session.commit(buffer);

    std::printf("\n=== Second import ===\n");
    print_results(engine.sync_account(feed, account.id));
    session.commit(buffer);

    std::printf("\n%zu transaction(s) in the ledger\n", ledger.transactions(account.id).size());
    return 0;
}
