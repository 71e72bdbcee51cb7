#include <ledgersync/reconcile.hpp>
#include <ledgersync/error.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <iterator>
#include <numeric>
#include <optional>
#include <ranges>
#include <utility>

namespace ledgersync {

namespace {

auto date_of(const Entity& entity) -> DateInt {
    return static_cast<DateInt>(get_scalar<std::int64_t>(entity.get("date")).value_or(0));
}

auto flag(const Entity& entity, std::string_view column) -> bool {
    auto value = entity.get(column);
    return value && truthy(*value);
}

auto has_financial_id(const Entity& entity) -> bool {
    auto id = get_scalar<std::string>(entity.get("financial_id"));
    return id && !id->empty();
}

}  // anonymous namespace

ReconciliationEngine::ReconciliationEngine(Ledger& ledger)
    : ledger_{ledger} {}

auto ReconciliationEngine::reconcile(const FeedResult& feed, std::string_view account_id,
                                     bool first_sync) -> std::vector<ReconciledTransaction> {
    auto account = require_account(account_id);
    matched_.clear();

    auto result = std::vector<ReconciledTransaction>{};
    if (first_sync) {
        if (auto entry = balance_entry(feed, account)) result.push_back(std::move(*entry));
    }

    // Banks deliver newest first; process oldest first, ordered by date
    // even when the feed is not.
    auto booked = std::vector<ExternalTransaction>{};
    for (const auto& external : feed.transactions | std::views::reverse) {
        if (!external.booked) {
            SPDLOG_WARN("skipping unsettled transaction {} ({})", external.imported_id,
                        external.payee_name);
            continue;
        }
        booked.push_back(external);
    }
    std::ranges::stable_sort(booked, {}, &ExternalTransaction::date);

    for (const auto& external : booked) {
        result.push_back(reconcile_one(external, account));
    }

    auto created = std::ranges::count(result, Outcome::created, &ReconciledTransaction::outcome);
    SPDLOG_INFO("reconciled {} transaction(s) into account {}: {} created", result.size(),
                account.id, created);
    return result;
}

auto ReconciliationEngine::sync_account(BankFeed& feed, std::string_view account_id,
                                        std::optional<DateInt> start_date)
    -> std::vector<ReconciledTransaction> {
    auto account = require_account(account_id);
    auto existing = ledger_.transactions(account.id);
    const auto first_sync = existing.empty();

    if (!start_date) {
        start_date = first_sync ? add_days(today(), -first_sync_days) : date_of(existing.front());
    }
    SPDLOG_INFO("syncing account {} from {}{}", account.id, *start_date,
                first_sync ? " (first sync)" : "");

    auto fetched = feed.fetch(account, *start_date);
    return reconcile(fetched, account.id, first_sync);
}

auto ReconciliationEngine::sync_all(BankFeed& feed) -> std::vector<ReconciledTransaction> {
    auto result = std::vector<ReconciledTransaction>{};
    auto synced = std::size_t{0};
    for (const auto& account : ledger_.select("accounts")) {
        if (is_deleted(account) || flag(account, "closed")) continue;
        auto source = get_scalar<std::string>(account.get("account_sync_source"));
        if (!source || source->empty()) continue;

        auto part = sync_account(feed, account.id);
        result.insert(result.end(), std::make_move_iterator(part.begin()),
                      std::make_move_iterator(part.end()));
        ++synced;
    }
    SPDLOG_INFO("synced {} linked account(s)", synced);
    return result;
}

auto ReconciliationEngine::require_account(std::string_view account_id) const -> Entity {
    auto account = ledger_.get("accounts", account_id);
    if (!account || is_deleted(*account)) {
        throw Error{ErrorKind::invalid_operation, "no account " + std::string{account_id}};
    }
    return std::move(*account);
}

auto ReconciliationEngine::balance_entry(const FeedResult& feed, const Entity& account)
    -> std::optional<ReconciledTransaction> {
    auto booked = feed.transactions | std::views::filter(&ExternalTransaction::booked);

    auto starting = feed.balance;
    if (feed.balance_kind == BalanceKind::current) {
        for (const auto& external : booked) starting -= external.amount;
    }
    if (starting == 0) return std::nullopt;

    auto existing = ledger_.transactions(account.id);
    if (std::ranges::any_of(existing, [](const Entity& t) {
            return flag(t, "starting_balance_flag");
        })) {
        SPDLOG_DEBUG("account {} already has a starting balance", account.id);
        return std::nullopt;
    }

    auto date = today();
    if (!std::ranges::empty(booked)) {
        date = std::ranges::min(booked, {}, &ExternalTransaction::date).date;
    }

    auto payee = ledger_.get_or_create_payee(starting_balance_payee);
    auto draft = TransactionDraft{
        .account_id = account.id,
        .date = date,
        .amount = starting,
        .payee_id = payee.id,
        .cleared = true,
        .starting_balance_flag = true,
    };
    if (!flag(account, "offbudget")) {
        draft.category_id = ledger_.get_or_create_category(starting_balance_category,
                                                           "Income", true).id;
    }

    auto transaction = ledger_.create_transaction(draft);
    SPDLOG_INFO("starting balance {} on {} for account {}", starting, date, account.id);
    return ReconciledTransaction{.transaction = std::move(transaction),
                                 .outcome = Outcome::created};
}

auto ReconciliationEngine::reconcile_one(const ExternalTransaction& external,
                                         const Entity& account) -> ReconciledTransaction {
    auto payee_id = std::optional<std::string>{};
    if (!external.payee_name.empty()) {
        payee_id = ledger_.get_or_create_payee(external.payee_name).id;
    }

    // Exact match by imported id, including deleted transactions so that a
    // removed import is not brought back. An empty id never matches.
    const auto has_imported_id = !external.imported_id.empty();
    for (const auto& local : has_imported_id ? ledger_.select("transactions")
                                             : std::vector<Entity>{}) {
        if (get_scalar<std::string>(local.get("acct")) != account.id) continue;
        if (get_scalar<std::string>(local.get("financial_id")) != external.imported_id) continue;

        matched_.push_back(local.id);
        if (is_deleted(local)) return {.transaction = local, .outcome = Outcome::unchanged};

        auto changes = Attributes{};
        if (get_scalar<std::int64_t>(local.get("amount")) != external.amount) {
            changes.emplace("amount", external.amount);
        }
        if (date_of(local) != external.date) {
            changes.emplace("date", std::int64_t{external.date});
        }
        if (changes.empty()) return {.transaction = local, .outcome = Outcome::unchanged};

        ledger_.update("transactions", local.id, changes);
        return {.transaction = *ledger_.get("transactions", local.id),
                .outcome = Outcome::matched};
    }

    if (auto local = fuzzy_match(external, account.id, payee_id)) {
        matched_.push_back(local->id);
        auto changes = Attributes{
            {"imported_description", external.payee_name},
            {"cleared", true},
        };
        if (has_imported_id) changes.emplace("financial_id", external.imported_id);
        if (!local->get("description") && payee_id) changes.emplace("description", *payee_id);
        ledger_.update("transactions", local->id, changes);
        SPDLOG_DEBUG("linked {} to local transaction {}", external.imported_id, local->id);
        return {.transaction = *ledger_.get("transactions", local->id),
                .outcome = Outcome::matched};
    }

    auto transaction = ledger_.create_transaction(TransactionDraft{
        .account_id = account.id,
        .date = external.date,
        .amount = external.amount,
        .payee_id = payee_id,
        .notes = external.notes,
        .financial_id = has_imported_id ? std::optional{external.imported_id} : std::nullopt,
        .imported_description = external.payee_name,
        .cleared = true,
    });
    matched_.push_back(transaction.id);
    return {.transaction = std::move(transaction), .outcome = Outcome::created};
}

auto ReconciliationEngine::fuzzy_match(const ExternalTransaction& external,
                                       const std::string& account_id,
                                       const std::optional<std::string>& payee_id) const
    -> std::optional<Entity> {
    auto best = std::optional<Entity>{};
    auto best_score = 0;
    auto tied = false;

    for (auto& local : ledger_.transactions(account_id)) {
        if (has_financial_id(local) || flag(local, "starting_balance_flag")) continue;
        if (std::ranges::find(matched_, local.id) != matched_.end()) continue;
        if (get_scalar<std::int64_t>(local.get("amount")) != external.amount) continue;
        if (std::abs(days_between(date_of(local), external.date)) > fuzzy_match_days) continue;

        auto score = (date_of(local) == external.date ? 1 : 0)
                   + (payee_id && get_scalar<std::string>(local.get("description")) == *payee_id
                          ? 1 : 0);
        if (score > best_score) {
            best = std::move(local);
            best_score = score;
            tied = false;
        } else if (score == best_score) {
            tied = true;
        }
    }

    if (!best || tied) {
        if (best) {
            SPDLOG_DEBUG("ambiguous match for {}; creating a new transaction",
                         external.imported_id);
        }
        return std::nullopt;
    }
    return best;
}

}  // namespace ledgersync
