#include <ledgersync/memory_store.hpp>
#include <ledgersync/error.hpp>

#include <utility>

namespace ledgersync {

MemoryStore::MemoryStore(const Schema& schema) {
    for (const auto& entity : schema.entities()) {
        auto& t = state_.tables[entity.dataset];
        for (const auto& column : entity.columns) {
            t.columns.push_back(column.name);
        }
    }
}

auto MemoryStore::table(std::string_view dataset) -> Table& {
    auto it = state_.tables.find(dataset);
    if (it == state_.tables.end()) {
        throw StoreError{"no such table: " + std::string{dataset}};
    }
    return it->second;
}

auto MemoryStore::table(std::string_view dataset) const -> const Table& {
    auto it = state_.tables.find(dataset);
    if (it == state_.tables.end()) {
        throw StoreError{"no such table: " + std::string{dataset}};
    }
    return it->second;
}

auto MemoryStore::get(std::string_view dataset, std::string_view row) const
    -> std::optional<Entity> {
    const auto& t = table(dataset);
    auto it = t.rows.find(row);
    if (it == t.rows.end()) return std::nullopt;
    return Entity{.id = it->first, .attributes = it->second};
}

auto MemoryStore::get_or_create(std::string_view dataset, std::string_view row) -> Entity {
    auto& t = table(dataset);
    auto [it, inserted] = t.rows.try_emplace(std::string{row});
    return Entity{.id = it->first, .attributes = it->second};
}

void MemoryStore::update(std::string_view dataset, std::string_view row,
                         const Attributes& attributes) {
    auto& t = table(dataset);
    auto it = t.rows.find(row);
    if (it == t.rows.end()) {
        throw StoreError{"no row " + std::string{row} + " in " + std::string{dataset}};
    }
    for (const auto& [column, value] : attributes) {
        if (is_null(value)) {
            it->second.erase(column);
        } else {
            it->second.insert_or_assign(column, value);
        }
    }
}

auto MemoryStore::select(std::string_view dataset) const -> std::vector<Entity> {
    const auto& t = table(dataset);
    auto result = std::vector<Entity>{};
    result.reserve(t.rows.size());
    for (const auto& [id, attributes] : t.rows) {
        result.push_back(Entity{.id = id, .attributes = attributes});
    }
    return result;
}

auto MemoryStore::declared_columns(std::string_view dataset) const
    -> std::optional<std::vector<std::string>> {
    auto it = state_.tables.find(dataset);
    if (it == state_.tables.end()) return std::nullopt;
    return it->second.columns;
}

auto MemoryStore::cell_timestamp(std::string_view dataset, std::string_view row,
                                 std::string_view column) const
    -> std::optional<LogicalTimestamp> {
    auto it = state_.cells.find(CellKey{dataset, row, column});
    if (it == state_.cells.end()) return std::nullopt;
    return it->second;
}

void MemoryStore::record_message(const ChangeRecord& record) {
    auto key = CellKey{record.dataset, record.row, record.column};
    auto it = state_.cells.find(key);
    if (it == state_.cells.end() || it->second < record.timestamp) {
        state_.cells.insert_or_assign(std::move(key), record.timestamp);
    }
    state_.messages.push_back(record);
}

void MemoryStore::queue_outgoing(std::span<const ChangeRecord> records) {
    state_.outgoing.insert(state_.outgoing.end(), records.begin(), records.end());
}

void MemoryStore::begin() {
    if (snapshot_) throw StoreError{"transaction already open"};
    snapshot_ = state_;
}

void MemoryStore::commit() {
    if (!snapshot_) throw StoreError{"no open transaction"};
    snapshot_.reset();
}

void MemoryStore::rollback() {
    if (!snapshot_) throw StoreError{"no open transaction"};
    state_ = std::move(*snapshot_);
    snapshot_.reset();
}

auto MemoryStore::load_clock() const -> std::optional<ReplicaClock> {
    return clock_;
}

void MemoryStore::save_clock(const ReplicaClock& clock) {
    clock_ = clock;
}

}  // namespace ledgersync
