/// @file sqlite_store.hpp
/// @brief LocalStore and ClockStore backed by a SQLite database.

#pragma once

#include <ledgersync/schema.hpp>
#include <ledgersync/store.hpp>

#include <string>

struct sqlite3;

namespace ledgersync {

/// A LocalStore on top of SQLite.
///
/// On open, creates (if missing) one table per dataset of the schema,
/// the `messages_crdt` log and the `messages_clock` row. Existing tables
/// are kept as they are; validate_schema() reports any that lack
/// declared columns. Owns the connection.
class SqliteStore : public LocalStore, public ClockStore {
public:
    /// Open or create a database file (":memory:" for a private one).
    /// @throws StoreError if the database cannot be opened or initialized.
    explicit SqliteStore(const std::string& path, const Schema& schema = ledger_schema());
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    auto operator=(const SqliteStore&) -> SqliteStore& = delete;

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
    auto pending_outgoing() const -> ChangeSet override;
    void clear_outgoing() override;

    void begin() override;
    void commit() override;
    void rollback() override;

    auto load_clock() const -> std::optional<ReplicaClock> override;
    void save_clock(const ReplicaClock& clock) override;

    /// The underlying connection. Not owned by the caller.
    auto handle() const -> sqlite3* { return db_; }

private:
    void create_tables(const Schema& schema);

    sqlite3* db_{nullptr};
};

}  // namespace ledgersync
