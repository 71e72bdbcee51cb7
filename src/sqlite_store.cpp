#include <ledgersync/sqlite_store.hpp>
#include <ledgersync/error.hpp>
#include <ledgersync/json.hpp>

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>

#include <utility>

namespace ledgersync {

namespace {

// RAII wrapper for sqlite3_stmt*.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_{db} {
        if (::sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StoreError{std::string{::sqlite3_errmsg(db)} + " in: " + sql};
        }
    }
    ~Statement() { ::sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    auto operator=(const Statement&) -> Statement& = delete;

    auto get() const -> sqlite3_stmt* { return stmt_; }

    void bind(int index, std::string_view text) {
        check(::sqlite3_bind_text(stmt_, index, text.data(), static_cast<int>(text.size()),
                                  SQLITE_TRANSIENT));
    }

    void bind(int index, std::int64_t value) {
        check(::sqlite3_bind_int64(stmt_, index, value));
    }

    void bind(int index, const ScalarValue& value) {
        std::visit(overload{
            [&](Null) { check(::sqlite3_bind_null(stmt_, index)); },
            [&](bool b) { check(::sqlite3_bind_int64(stmt_, index, b ? 1 : 0)); },
            [&](std::int64_t i) { check(::sqlite3_bind_int64(stmt_, index, i)); },
            [&](double d) { check(::sqlite3_bind_double(stmt_, index, d)); },
            [&](const std::string& s) { bind(index, std::string_view{s}); },
        }, value);
    }

    // True while rows remain; false once the statement is done.
    auto step() -> bool {
        auto rc = ::sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StoreError{::sqlite3_errmsg(db_)};
    }

    auto column_text(int index) const -> std::string {
        const auto* text = ::sqlite3_column_text(stmt_, index);
        auto size = ::sqlite3_column_bytes(stmt_, index);
        if (!text) return {};
        return std::string{reinterpret_cast<const char*>(text), static_cast<std::size_t>(size)};
    }

    auto column_value(int index) const -> ScalarValue {
        switch (::sqlite3_column_type(stmt_, index)) {
            case SQLITE_INTEGER: return ScalarValue{std::int64_t{::sqlite3_column_int64(stmt_, index)}};
            case SQLITE_FLOAT:   return ScalarValue{::sqlite3_column_double(stmt_, index)};
            case SQLITE_TEXT:    return ScalarValue{column_text(index)};
            case SQLITE_NULL:    return ScalarValue{Null{}};
            default:             return ScalarValue{column_text(index)};
        }
    }

private:
    void check(int rc) const {
        if (rc != SQLITE_OK) throw StoreError{::sqlite3_errmsg(db_)};
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_{nullptr};
};

void exec(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (::sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        auto msg = std::string{err ? err : "unknown error"};
        ::sqlite3_free(err);
        throw StoreError{msg};
    }
}

// Identifiers come from the schema or from change records, so they are
// always quoted.
auto quote(std::string_view identifier) -> std::string {
    auto out = std::string{"\""};
    for (auto c : identifier) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

auto affinity(ValueKind kind) -> std::string_view {
    switch (kind) {
        case ValueKind::boolean: return "INTEGER";
        case ValueKind::integer: return "INTEGER";
        case ValueKind::real:    return "REAL";
        case ValueKind::text:    return "TEXT";
    }
    return "";
}

auto read_entity(const Statement& stmt) -> Entity {
    auto entity = Entity{};
    auto count = ::sqlite3_column_count(stmt.get());
    for (int i = 0; i < count; ++i) {
        auto name = std::string{::sqlite3_column_name(stmt.get(), i)};
        if (name == id_column) {
            entity.id = stmt.column_text(i);
        } else if (::sqlite3_column_type(stmt.get(), i) != SQLITE_NULL) {
            entity.attributes.emplace(std::move(name), stmt.column_value(i));
        }
    }
    return entity;
}

}  // anonymous namespace

SqliteStore::SqliteStore(const std::string& path, const Schema& schema) {
    if (::sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        auto msg = std::string{db_ ? ::sqlite3_errmsg(db_) : "out of memory"};
        ::sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError{"cannot open " + path + ": " + msg};
    }
    try {
        create_tables(schema);
    } catch (const Error&) {
        ::sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    SPDLOG_DEBUG("opened sqlite store {}", path);
}

SqliteStore::~SqliteStore() {
    if (db_) ::sqlite3_close(db_);
}

void SqliteStore::create_tables(const Schema& schema) {
    for (const auto& entity : schema.entities()) {
        auto sql = "CREATE TABLE IF NOT EXISTS " + quote(entity.dataset) + " (id TEXT PRIMARY KEY";
        for (const auto& column : entity.columns) {
            sql += ", " + quote(column.name) + " " + std::string{affinity(column.kind)};
        }
        sql += ")";
        exec(db_, sql);
    }
    exec(db_,
         "CREATE TABLE IF NOT EXISTS messages_crdt ("
         "  id INTEGER PRIMARY KEY,"
         "  millis INTEGER NOT NULL,"
         "  counter INTEGER NOT NULL,"
         "  client_id TEXT NOT NULL,"
         "  dataset TEXT NOT NULL,"
         "  row TEXT NOT NULL,"
         "  \"column\" TEXT NOT NULL,"
         "  value,"
         "  UNIQUE (millis, counter, client_id, dataset, row, \"column\"))");
    exec(db_,
         "CREATE INDEX IF NOT EXISTS messages_crdt_cell"
         " ON messages_crdt (dataset, row, \"column\")");
    exec(db_,
         "CREATE TABLE IF NOT EXISTS messages_outbox ("
         "  id INTEGER PRIMARY KEY,"
         "  record TEXT NOT NULL)");
    exec(db_,
         "CREATE TABLE IF NOT EXISTS messages_clock ("
         "  id INTEGER PRIMARY KEY CHECK (id = 0),"
         "  clock TEXT NOT NULL)");
}

auto SqliteStore::get(std::string_view dataset, std::string_view row) const
    -> std::optional<Entity> {
    auto stmt = Statement{db_, "SELECT * FROM " + quote(dataset) + " WHERE id = ?"};
    stmt.bind(1, row);
    if (!stmt.step()) return std::nullopt;
    return read_entity(stmt);
}

auto SqliteStore::get_or_create(std::string_view dataset, std::string_view row) -> Entity {
    auto insert = Statement{db_, "INSERT OR IGNORE INTO " + quote(dataset) + " (id) VALUES (?)"};
    insert.bind(1, row);
    insert.step();
    auto entity = get(dataset, row);
    if (!entity) throw StoreError{"row vanished after insert: " + std::string{row}};
    return std::move(*entity);
}

void SqliteStore::update(std::string_view dataset, std::string_view row,
                         const Attributes& attributes) {
    if (attributes.empty()) return;

    auto sql = "UPDATE " + quote(dataset) + " SET ";
    auto first = true;
    for (const auto& [column, value] : attributes) {
        if (!first) sql += ", ";
        sql += quote(column) + " = ?";
        first = false;
    }
    sql += " WHERE id = ?";

    auto stmt = Statement{db_, sql};
    auto index = 1;
    for (const auto& [column, value] : attributes) {
        stmt.bind(index++, value);
    }
    stmt.bind(index, row);
    stmt.step();
    if (::sqlite3_changes(db_) == 0) {
        throw StoreError{"no row " + std::string{row} + " in " + std::string{dataset}};
    }
}

auto SqliteStore::select(std::string_view dataset) const -> std::vector<Entity> {
    auto stmt = Statement{db_, "SELECT * FROM " + quote(dataset) + " ORDER BY id"};
    auto result = std::vector<Entity>{};
    while (stmt.step()) {
        result.push_back(read_entity(stmt));
    }
    return result;
}

auto SqliteStore::declared_columns(std::string_view dataset) const
    -> std::optional<std::vector<std::string>> {
    auto stmt = Statement{db_, "SELECT name FROM pragma_table_info(?)"};
    stmt.bind(1, dataset);
    auto columns = std::vector<std::string>{};
    auto found = false;
    while (stmt.step()) {
        found = true;
        auto name = stmt.column_text(0);
        if (name != id_column) columns.push_back(std::move(name));
    }
    if (!found) return std::nullopt;
    return columns;
}

auto SqliteStore::cell_timestamp(std::string_view dataset, std::string_view row,
                                 std::string_view column) const
    -> std::optional<LogicalTimestamp> {
    auto stmt = Statement{db_,
        "SELECT millis, counter, client_id FROM messages_crdt"
        " WHERE dataset = ? AND row = ? AND \"column\" = ?"
        " ORDER BY millis DESC, counter DESC, client_id DESC LIMIT 1"};
    stmt.bind(1, dataset);
    stmt.bind(2, row);
    stmt.bind(3, column);
    if (!stmt.step()) return std::nullopt;
    return LogicalTimestamp{
        .millis = static_cast<std::uint64_t>(::sqlite3_column_int64(stmt.get(), 0)),
        .counter = static_cast<std::uint16_t>(::sqlite3_column_int(stmt.get(), 1)),
        .client_id = stmt.column_text(2),
    };
}

void SqliteStore::record_message(const ChangeRecord& record) {
    auto stmt = Statement{db_,
        "INSERT OR IGNORE INTO messages_crdt"
        " (millis, counter, client_id, dataset, row, \"column\", value)"
        " VALUES (?, ?, ?, ?, ?, ?, ?)"};
    stmt.bind(1, static_cast<std::int64_t>(record.timestamp.millis));
    stmt.bind(2, std::int64_t{record.timestamp.counter});
    stmt.bind(3, std::string_view{record.timestamp.client_id});
    stmt.bind(4, std::string_view{record.dataset});
    stmt.bind(5, std::string_view{record.row});
    stmt.bind(6, std::string_view{record.column});
    stmt.bind(7, record.value);
    stmt.step();
}

// Queued records are kept as JSON so every value kind reads back exactly.
void SqliteStore::queue_outgoing(std::span<const ChangeRecord> records) {
    auto stmt = Statement{db_, "INSERT INTO messages_outbox (record) VALUES (?)"};
    for (const auto& record : records) {
        auto text = nlohmann::json(record).dump();
        stmt.bind(1, std::string_view{text});
        stmt.step();
        ::sqlite3_reset(stmt.get());
    }
}

auto SqliteStore::pending_outgoing() const -> ChangeSet {
    auto stmt = Statement{db_, "SELECT record FROM messages_outbox ORDER BY id"};
    auto records = ChangeSet{};
    while (stmt.step()) {
        try {
            records.push_back(nlohmann::json::parse(stmt.column_text(0)).get<ChangeRecord>());
        } catch (const nlohmann::json::exception& e) {
            throw StoreError{std::string{"corrupt messages_outbox row: "} + e.what()};
        } catch (const DecodeError& e) {
            throw StoreError{std::string{"corrupt messages_outbox row: "} + e.what()};
        }
    }
    return records;
}

void SqliteStore::clear_outgoing() {
    exec(db_, "DELETE FROM messages_outbox");
}

void SqliteStore::begin() {
    exec(db_, "BEGIN IMMEDIATE");
}

void SqliteStore::commit() {
    exec(db_, "COMMIT");
}

void SqliteStore::rollback() {
    exec(db_, "ROLLBACK");
}

auto SqliteStore::load_clock() const -> std::optional<ReplicaClock> {
    auto stmt = Statement{db_, "SELECT clock FROM messages_clock WHERE id = 0"};
    if (!stmt.step()) return std::nullopt;
    try {
        return nlohmann::json::parse(stmt.column_text(0)).get<ReplicaClock>();
    } catch (const nlohmann::json::exception& e) {
        throw StoreError{std::string{"corrupt messages_clock row: "} + e.what()};
    }
}

void SqliteStore::save_clock(const ReplicaClock& clock) {
    auto stmt = Statement{db_,
        "INSERT INTO messages_clock (id, clock) VALUES (0, ?)"
        " ON CONFLICT (id) DO UPDATE SET clock = excluded.clock"};
    auto text = nlohmann::json(clock).dump();
    stmt.bind(1, std::string_view{text});
    stmt.step();
}

}  // namespace ledgersync
