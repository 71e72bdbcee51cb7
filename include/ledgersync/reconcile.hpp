/// @file reconcile.hpp
/// @brief ReconciliationEngine: imports bank feed transactions exactly once.

#pragma once

#include <ledgersync/date.hpp>
#include <ledgersync/ledger.hpp>
#include <ledgersync/store.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ledgersync {

/// A transaction as the bank feed reports it.
struct ExternalTransaction {
    DateInt date = 0;          ///< Booking day.
    std::string payee_name;    ///< Counterparty as the bank names it.
    std::int64_t amount = 0;   ///< Signed amount in cents.
    std::string imported_id;   ///< The bank's id, stable across fetches.
    bool booked = true;        ///< Settled; unsettled ones are not imported.
    std::string notes;         ///< Free text.
};

/// How the feed's balance relates to its transactions.
enum class BalanceKind : std::uint8_t {
    current,   ///< Balance after every booked transaction in the feed.
    starting,  ///< Balance before the oldest transaction in the feed.
};

/// One fetch from a bank feed.
struct FeedResult {
    std::int64_t balance = 0;
    BalanceKind balance_kind = BalanceKind::current;
    std::vector<ExternalTransaction> transactions;  ///< Newest first, as banks deliver.
};

/// Source of bank transactions for one account.
class BankFeed {
public:
    virtual ~BankFeed() = default;

    /// Transactions booked on or after start_date.
    /// @throws TransportError if the provider cannot be reached.
    virtual auto fetch(const Entity& account, DateInt start_date) -> FeedResult = 0;
};

/// What reconciling one transaction did to the ledger.
enum class Outcome : std::uint8_t {
    created,    ///< A new local transaction was buffered.
    matched,    ///< An existing local transaction was linked to it or changed.
    unchanged,  ///< It was already imported and nothing differed.
};

constexpr auto to_string_view(Outcome outcome) noexcept -> std::string_view {
    switch (outcome) {
        case Outcome::created:   return "created";
        case Outcome::matched:   return "matched";
        case Outcome::unchanged: return "unchanged";
    }
    return "unknown";
}

/// A local transaction together with how it was reached.
struct ReconciledTransaction {
    Entity transaction;
    Outcome outcome;
};

/// Largest date distance, in days, for a fuzzy match.
inline constexpr std::int64_t fuzzy_match_days = 7;

/// Days fetched on an account's first sync.
inline constexpr std::int64_t first_sync_days = 90;

/// Imports external transactions into the ledger.
///
/// Transactions are processed oldest first. Each one is matched by
/// imported id, then fuzzily against unlinked local transactions of the
/// same amount, and created only if neither finds exactly one candidate.
/// All writes go through the Ledger's change buffer.
class ReconciliationEngine {
public:
    explicit ReconciliationEngine(Ledger& ledger);

    /// Reconcile a feed into an account.
    ///
    /// On first sync, a starting-balance transaction is created first
    /// unless the balance is zero or the account already has one.
    /// @throws Error(invalid_operation) if the account does not exist.
    auto reconcile(const FeedResult& feed, std::string_view account_id, bool first_sync)
        -> std::vector<ReconciledTransaction>;

    /// Fetch from the feed and reconcile.
    ///
    /// First sync means the account has no transactions yet. Without an
    /// explicit start date, fetching starts at the newest local
    /// transaction, or first_sync_days before today.
    auto sync_account(BankFeed& feed, std::string_view account_id,
                      std::optional<DateInt> start_date = std::nullopt)
        -> std::vector<ReconciledTransaction>;

    /// Sync every open account linked to a bank feed.
    ///
    /// An account is linked when its account_sync_source is non-empty.
    /// Results are concatenated in account order.
    auto sync_all(BankFeed& feed) -> std::vector<ReconciledTransaction>;

private:
    auto require_account(std::string_view account_id) const -> Entity;
    auto balance_entry(const FeedResult& feed, const Entity& account)
        -> std::optional<ReconciledTransaction>;
    auto reconcile_one(const ExternalTransaction& external, const Entity& account)
        -> ReconciledTransaction;
    auto fuzzy_match(const ExternalTransaction& external, const std::string& account_id,
                     const std::optional<std::string>& payee_id) const
        -> std::optional<Entity>;

    Ledger& ledger_;
    std::vector<std::string> matched_;
};

}  // namespace ledgersync
