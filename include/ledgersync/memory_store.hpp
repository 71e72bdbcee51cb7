/// @file memory_store.hpp
/// @brief In-process LocalStore and ClockStore.

#pragma once

#include <ledgersync/schema.hpp>
#include <ledgersync/store.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace ledgersync {

/// A LocalStore held entirely in memory.
///
/// One table per dataset of the schema it was built from. Transactions
/// snapshot the whole state on begin() and restore it on rollback().
/// The clock lives beside the tables and is not covered by transactions.
class MemoryStore : public LocalStore, public ClockStore {
public:
    /// Create empty tables for every dataset of the schema.
    explicit MemoryStore(const Schema& schema = ledger_schema());

    auto get(std::string_view dataset, std::string_view row) const
        -> std::optional<Entity> override;
    auto get_or_create(std::string_view dataset, std::string_view row) -> Entity override;
    void update(std::string_view dataset, std::string_view row,
                const Attributes& attributes) override;
    auto select(std::string_view dataset) const -> std::vector<Entity> override;
    auto declared_columns(std::string_view dataset) const
        -> std::optional<std::vector<std::string>> override;

    auto cell_timestamp(std::string_view dataset, std::string_view row,
                        std::string_view column) const
        -> std::optional<LogicalTimestamp> override;
    void record_message(const ChangeRecord& record) override;

    void queue_outgoing(std::span<const ChangeRecord> records) override;
    auto pending_outgoing() const -> ChangeSet override { return state_.outgoing; }
    void clear_outgoing() override { state_.outgoing.clear(); }

    void begin() override;
    void commit() override;
    void rollback() override;

    auto load_clock() const -> std::optional<ReplicaClock> override;
    void save_clock(const ReplicaClock& clock) override;

    /// Number of records in the last-writer-wins log.
    auto message_count() const -> std::size_t { return state_.messages.size(); }

    /// Whether a transaction is open.
    auto in_transaction() const -> bool { return snapshot_.has_value(); }

private:
    using CellKey = std::tuple<std::string, std::string, std::string>;

    struct Table {
        std::vector<std::string> columns;
        std::map<std::string, Attributes, std::less<>> rows;
    };

    struct State {
        std::map<std::string, Table, std::less<>> tables;
        std::map<CellKey, LogicalTimestamp> cells;
        std::vector<ChangeRecord> messages;
        ChangeSet outgoing;
    };

    auto table(std::string_view dataset) -> Table&;
    auto table(std::string_view dataset) const -> const Table&;

    State state_;
    std::optional<State> snapshot_;
    std::optional<ReplicaClock> clock_;
};

}  // namespace ledgersync
