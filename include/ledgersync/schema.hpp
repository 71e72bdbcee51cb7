/// @file schema.hpp
/// @brief Statically declared entity schema for the replicated ledger.

#pragma once

#include <ledgersync/value.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace ledgersync {

/// Name of the implicit primary-key column every entity carries.
inline constexpr std::string_view id_column = "id";

/// One declared field of an entity.
struct ColumnSpec {
    std::string name;  ///< Column name as it appears in change records.
    ValueKind kind;    ///< Storage affinity.

    auto operator==(const ColumnSpec&) const -> bool = default;
};

/// One supported dataset and its columns (the id column is implicit).
struct EntitySchema {
    std::string dataset;              ///< Dataset (table) name.
    std::vector<ColumnSpec> columns;  ///< Declared columns, excluding id.

    /// Find a column by name, or nullptr.
    auto find_column(std::string_view name) const -> const ColumnSpec*;

    auto operator==(const EntitySchema&) const -> bool = default;
};

/// The set of datasets this replica understands.
///
/// Lookups are by exact name; anything not declared here is rejected
/// during merge rather than silently dropped.
class Schema {
public:
    Schema() = default;

    /// Construct from a list of entity declarations.
    explicit Schema(std::vector<EntitySchema> entities);

    /// Find a dataset, or nullptr if it is not supported.
    auto find(std::string_view dataset) const -> const EntitySchema*;

    /// Resolve a column of a dataset, or nullptr if either is unknown.
    auto resolve_column(std::string_view dataset, std::string_view column) const
        -> const ColumnSpec*;

    /// All declared datasets, in declaration order.
    auto entities() const -> const std::vector<EntitySchema>& { return entities_; }

private:
    std::vector<EntitySchema> entities_;
};

/// The ledger's datasets: accounts, banks, transactions, payees,
/// payee_mapping, categories, category_groups, category_mapping, rules,
/// schedules and notes.
auto ledger_schema() -> const Schema&;

}  // namespace ledgersync
