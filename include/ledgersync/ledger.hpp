/// @file ledger.hpp
/// @brief Ledger: typed reads and buffered writes over the replicated datasets.

#pragma once

#include <ledgersync/change_buffer.hpp>
#include <ledgersync/date.hpp>
#include <ledgersync/store.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ledgersync {

/// Payee attributed to synthesized starting-balance transactions.
inline constexpr std::string_view starting_balance_payee = "Starting Balance";

/// Category that on-budget starting balances are booked to.
inline constexpr std::string_view starting_balance_category = "Starting Balances";

/// Fields of a transaction to create.
struct TransactionDraft {
    std::string account_id;                          ///< Owning account (acct).
    DateInt date = 0;                                ///< Booking day.
    std::int64_t amount = 0;                         ///< Signed amount in cents.
    std::optional<std::string> payee_id;             ///< Payee (description).
    std::optional<std::string> category_id;          ///< Budget category.
    std::string notes;                               ///< Free text.
    std::optional<std::string> financial_id;         ///< External import id.
    std::optional<std::string> imported_description; ///< Payee name as the feed sent it.
    bool cleared = true;
    bool starting_balance_flag = false;
};

/// Read-your-writes view of the ledger.
///
/// Reads combine the local store with the writes still pending in the
/// change buffer. Writes only go to the buffer; they reach the store when
/// the buffer is committed through a SyncSession.
class Ledger {
public:
    Ledger(const LocalStore& store, ChangeBuffer& buffer);

    // -- Generic access -------------------------------------------------------

    /// A row with its pending writes applied, or nullopt if neither the
    /// store nor the buffer has it.
    auto get(std::string_view dataset, std::string_view row) const -> std::optional<Entity>;

    /// Every row of a dataset, with pending writes applied. Stored rows
    /// come first, ordered by id, then rows that exist only in the buffer.
    auto select(std::string_view dataset) const -> std::vector<Entity>;

    /// Buffer writes to a row.
    void update(std::string_view dataset, std::string_view row, const Attributes& attributes);

    // -- Accounts -------------------------------------------------------------

    auto create_account(std::string_view name, bool offbudget = false) -> Entity;

    // -- Payees and categories ------------------------------------------------

    /// The non-deleted payee with this exact name, if any.
    auto find_payee(std::string_view name) const -> std::optional<Entity>;

    /// Find a payee by name, creating it (and its payee_mapping row) if
    /// missing.
    auto get_or_create_payee(std::string_view name) -> Entity;

    /// Find a category by name, creating it in a group of that name if
    /// missing.
    auto get_or_create_category(std::string_view name, std::string_view group_name,
                                bool is_income = false) -> Entity;

    // -- Transactions ---------------------------------------------------------

    auto create_transaction(const TransactionDraft& draft) -> Entity;

    /// Non-deleted transactions of an account, newest first.
    auto transactions(std::string_view account_id) const -> std::vector<Entity>;

private:
    auto find_by_name(std::string_view dataset, std::string_view name) const
        -> std::optional<Entity>;

    const LocalStore& store_;
    ChangeBuffer& buffer_;
};

/// The tombstone column is set.
auto is_deleted(const Entity& entity) -> bool;

}  // namespace ledgersync
