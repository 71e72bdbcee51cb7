/// @file store.hpp
/// @brief Collaborator interfaces for local persistence: LocalStore and ClockStore.

#pragma once

#include <ledgersync/change.hpp>
#include <ledgersync/clock.hpp>
#include <ledgersync/schema.hpp>
#include <ledgersync/types.hpp>
#include <ledgersync/value.hpp>

#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ledgersync {

/// Column name to value map for one entity.
using Attributes = std::map<std::string, ScalarValue, std::less<>>;

/// One row of a dataset.
struct Entity {
    std::string id;         ///< Primary key (the change record's row).
    Attributes attributes;  ///< Non-id columns; absent means never written.

    /// Read a column, or nullopt if it was never written.
    auto get(std::string_view column) const -> std::optional<ScalarValue> {
        auto it = attributes.find(column);
        if (it == attributes.end()) return std::nullopt;
        return it->second;
    }

    auto operator==(const Entity&) const -> bool = default;
};

/// A keyed relational store addressed by (dataset, row).
///
/// Besides entity rows, the store keeps the field-level
/// last-writer-wins log: the timestamp of the newest record applied to
/// each (dataset, row, column). It also queues the records this replica
/// issued that have not reached the relay yet. Implementations must make
/// everything
/// written between begin() and commit() visible atomically.
class LocalStore {
public:
    virtual ~LocalStore() = default;

    // -- Entities -------------------------------------------------------------

    /// Read a row, or nullopt if it does not exist.
    virtual auto get(std::string_view dataset, std::string_view row) const
        -> std::optional<Entity> = 0;

    /// Read a row, inserting an empty one first if it does not exist.
    virtual auto get_or_create(std::string_view dataset, std::string_view row) -> Entity = 0;

    /// Assign columns of an existing row; other columns are left alone.
    virtual void update(std::string_view dataset, std::string_view row,
                        const Attributes& attributes) = 0;

    /// All rows of a dataset, ordered by id.
    virtual auto select(std::string_view dataset) const -> std::vector<Entity> = 0;

    /// Columns the store actually has for a dataset (excluding id), or
    /// nullopt if the dataset does not exist.
    virtual auto declared_columns(std::string_view dataset) const
        -> std::optional<std::vector<std::string>> = 0;

    // -- Last-writer-wins log -------------------------------------------------

    /// Timestamp of the newest record applied to a cell.
    virtual auto cell_timestamp(std::string_view dataset, std::string_view row,
                                std::string_view column) const
        -> std::optional<LogicalTimestamp> = 0;

    /// Append an applied record to the log.
    virtual void record_message(const ChangeRecord& record) = 0;

    // -- Outgoing queue -------------------------------------------------------

    /// Queue locally issued records until the relay accepts them.
    virtual void queue_outgoing(std::span<const ChangeRecord> records) = 0;

    /// Queued records, oldest first.
    virtual auto pending_outgoing() const -> ChangeSet = 0;

    /// Drop every queued record.
    virtual void clear_outgoing() = 0;

    // -- Transactions ---------------------------------------------------------

    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

/// Persists the ReplicaClock outside the replicated tables, so that
/// clock updates are never themselves replicated.
class ClockStore {
public:
    virtual ~ClockStore() = default;

    /// The stored clock, or nullopt for a replica that was never initialized.
    virtual auto load_clock() const -> std::optional<ReplicaClock> = 0;

    /// Replace the stored clock.
    virtual void save_clock(const ReplicaClock& clock) = 0;
};

/// Load the stored clock, creating and saving a fresh one (random client
/// id) on first use.
auto load_or_create_clock(ClockStore& store) -> ReplicaClock;

/// RAII scope for a LocalStore transaction.
///
/// Rolls back on destruction unless commit() was called.
class StoreTransaction {
public:
    explicit StoreTransaction(LocalStore& store);
    ~StoreTransaction();

    StoreTransaction(const StoreTransaction&) = delete;
    auto operator=(const StoreTransaction&) -> StoreTransaction& = delete;

    void commit();

private:
    LocalStore& store_;
    bool active_{true};
};

/// Check that the store has every dataset and column the schema declares.
/// @throws UnsupportedSchemaError naming the first missing identifier.
void validate_schema(const Schema& schema, const LocalStore& store);

}  // namespace ledgersync
