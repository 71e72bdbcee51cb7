#include <ledgersync/schema.hpp>

#include <algorithm>
#include <utility>

namespace ledgersync {

auto EntitySchema::find_column(std::string_view name) const -> const ColumnSpec* {
    auto it = std::ranges::find(columns, name, &ColumnSpec::name);
    return it != columns.end() ? &*it : nullptr;
}

Schema::Schema(std::vector<EntitySchema> entities)
    : entities_{std::move(entities)} {}

auto Schema::find(std::string_view dataset) const -> const EntitySchema* {
    auto it = std::ranges::find(entities_, dataset, &EntitySchema::dataset);
    return it != entities_.end() ? &*it : nullptr;
}

auto Schema::resolve_column(std::string_view dataset, std::string_view column) const
    -> const ColumnSpec* {
    const auto* entity = find(dataset);
    return entity ? entity->find_column(column) : nullptr;
}

auto ledger_schema() -> const Schema& {
    using enum ValueKind;
    static const auto schema = Schema{{
        {"accounts", {
            {"account_id", text}, {"name", text}, {"balance_current", integer},
            {"balance_available", integer}, {"balance_limit", integer}, {"mask", text},
            {"official_name", text}, {"type", text}, {"subtype", text}, {"bank", text},
            {"offbudget", boolean}, {"closed", boolean}, {"tombstone", boolean},
            {"sort_order", real}, {"account_sync_source", text}, {"last_sync", text},
            {"last_reconciled", text},
        }},
        {"banks", {
            {"bank_id", text}, {"name", text}, {"tombstone", boolean},
        }},
        {"transactions", {
            {"isParent", boolean}, {"isChild", boolean}, {"acct", text}, {"category", text},
            {"amount", integer}, {"description", text}, {"notes", text}, {"date", integer},
            {"financial_id", text}, {"type", text}, {"location", text}, {"error", text},
            {"imported_description", text}, {"starting_balance_flag", boolean},
            {"transferred_id", text}, {"sort_order", real}, {"tombstone", boolean},
            {"cleared", boolean}, {"pending", boolean}, {"parent_id", text},
            {"schedule", text}, {"reconciled", boolean},
        }},
        {"payees", {
            {"name", text}, {"transfer_acct", text}, {"category", text},
            {"tombstone", boolean},
        }},
        {"payee_mapping", {
            {"targetId", text},
        }},
        {"categories", {
            {"name", text}, {"is_income", boolean}, {"cat_group", text},
            {"sort_order", real}, {"hidden", boolean}, {"goal_def", text},
            {"tombstone", boolean},
        }},
        {"category_groups", {
            {"name", text}, {"is_income", boolean}, {"sort_order", real},
            {"hidden", boolean}, {"tombstone", boolean},
        }},
        {"category_mapping", {
            {"transferId", text},
        }},
        {"rules", {
            {"stage", text}, {"conditions", text}, {"actions", text},
            {"conditions_op", text}, {"tombstone", boolean},
        }},
        {"schedules", {
            {"name", text}, {"rule", text}, {"active", boolean}, {"completed", boolean},
            {"posts_transaction", boolean}, {"tombstone", boolean},
        }},
        {"notes", {
            {"note", text},
        }},
    }};
    return schema;
}

}  // namespace ledgersync
