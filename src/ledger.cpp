#include <ledgersync/ledger.hpp>

#include "util/random.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace ledgersync {

namespace {

auto sort_order_now() -> double {
    using namespace std::chrono;
    return static_cast<double>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

auto date_of(const Entity& entity) -> DateInt {
    return static_cast<DateInt>(get_scalar<std::int64_t>(entity.get("date")).value_or(0));
}

}  // anonymous namespace

auto is_deleted(const Entity& entity) -> bool {
    auto tombstone = entity.get("tombstone");
    return tombstone && truthy(*tombstone);
}

Ledger::Ledger(const LocalStore& store, ChangeBuffer& buffer)
    : store_{store}, buffer_{buffer} {}

// -- Generic access -----------------------------------------------------------

auto Ledger::get(std::string_view dataset, std::string_view row) const
    -> std::optional<Entity> {
    auto entity = store_.get(dataset, row);
    auto pending = buffer_.pending_attributes(dataset, row);
    if (!entity && pending.empty()) return std::nullopt;
    if (!entity) entity = Entity{.id = std::string{row}, .attributes = {}};
    for (auto& [column, value] : pending) {
        if (is_null(value)) {
            entity->attributes.erase(column);
        } else {
            entity->attributes.insert_or_assign(column, std::move(value));
        }
    }
    return entity;
}

auto Ledger::select(std::string_view dataset) const -> std::vector<Entity> {
    auto result = std::vector<Entity>{};
    for (const auto& stored : store_.select(dataset)) {
        result.push_back(*get(dataset, stored.id));
    }
    for (const auto& row : buffer_.pending_rows(dataset)) {
        if (!store_.get(dataset, row)) {
            result.push_back(*get(dataset, row));
        }
    }
    return result;
}

void Ledger::update(std::string_view dataset, std::string_view row,
                    const Attributes& attributes) {
    buffer_.record_entity(dataset, row, attributes);
}

// -- Accounts -----------------------------------------------------------------

auto Ledger::create_account(std::string_view name, bool offbudget) -> Entity {
    auto id = util::make_uuid();
    update("accounts", id, {
        {"name", std::string{name}},
        {"offbudget", offbudget},
        {"closed", false},
        {"tombstone", false},
        {"sort_order", sort_order_now()},
    });
    return *get("accounts", id);
}

// -- Payees and categories ----------------------------------------------------

auto Ledger::find_by_name(std::string_view dataset, std::string_view name) const
    -> std::optional<Entity> {
    for (auto& entity : select(dataset)) {
        if (is_deleted(entity)) continue;
        if (get_scalar<std::string>(entity.get("name")) == name) return std::move(entity);
    }
    return std::nullopt;
}

auto Ledger::find_payee(std::string_view name) const -> std::optional<Entity> {
    return find_by_name("payees", name);
}

auto Ledger::get_or_create_payee(std::string_view name) -> Entity {
    if (auto payee = find_payee(name)) return std::move(*payee);

    auto id = util::make_uuid();
    update("payees", id, {{"name", std::string{name}}, {"tombstone", false}});
    update("payee_mapping", id, {{"targetId", id}});
    return *get("payees", id);
}

auto Ledger::get_or_create_category(std::string_view name, std::string_view group_name,
                                    bool is_income) -> Entity {
    if (auto category = find_by_name("categories", name)) return std::move(*category);

    auto group = find_by_name("category_groups", group_name);
    if (!group) {
        auto group_id = util::make_uuid();
        update("category_groups", group_id, {
            {"name", std::string{group_name}},
            {"is_income", is_income},
            {"hidden", false},
            {"tombstone", false},
            {"sort_order", sort_order_now()},
        });
        group = get("category_groups", group_id);
    }

    auto id = util::make_uuid();
    update("categories", id, {
        {"name", std::string{name}},
        {"is_income", is_income},
        {"cat_group", group->id},
        {"hidden", false},
        {"tombstone", false},
        {"sort_order", sort_order_now()},
    });
    update("category_mapping", id, {{"transferId", id}});
    return *get("categories", id);
}

// -- Transactions -------------------------------------------------------------

auto Ledger::create_transaction(const TransactionDraft& draft) -> Entity {
    auto id = util::make_uuid();
    auto attributes = Attributes{
        {"acct", draft.account_id},
        {"date", std::int64_t{draft.date}},
        {"amount", draft.amount},
        {"notes", draft.notes},
        {"cleared", draft.cleared},
        {"starting_balance_flag", draft.starting_balance_flag},
        {"isParent", false},
        {"isChild", false},
        {"tombstone", false},
        {"sort_order", sort_order_now()},
    };
    if (draft.payee_id) attributes.emplace("description", *draft.payee_id);
    if (draft.category_id) attributes.emplace("category", *draft.category_id);
    if (draft.financial_id) attributes.emplace("financial_id", *draft.financial_id);
    if (draft.imported_description) {
        attributes.emplace("imported_description", *draft.imported_description);
    }
    update("transactions", id, attributes);
    return *get("transactions", id);
}

auto Ledger::transactions(std::string_view account_id) const -> std::vector<Entity> {
    auto result = std::vector<Entity>{};
    for (auto& entity : select("transactions")) {
        if (is_deleted(entity)) continue;
        if (get_scalar<std::string>(entity.get("acct")) != account_id) continue;
        result.push_back(std::move(entity));
    }
    std::ranges::stable_sort(result, [](const Entity& a, const Entity& b) {
        return date_of(a) > date_of(b);
    });
    return result;
}

}  // namespace ledgersync
