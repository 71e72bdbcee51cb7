#include <ledgersync/store.hpp>
#include <ledgersync/error.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ledgersync {

auto load_or_create_clock(ClockStore& store) -> ReplicaClock {
    if (auto clock = store.load_clock()) return *clock;
    auto clock = make_replica_clock();
    store.save_clock(clock);
    SPDLOG_INFO("initialized replica clock for client {}", clock.client_id);
    return clock;
}

StoreTransaction::StoreTransaction(LocalStore& store)
    : store_{store} {
    store_.begin();
}

StoreTransaction::~StoreTransaction() {
    if (!active_) return;
    try {
        store_.rollback();
    } catch (const Error& e) {
        SPDLOG_ERROR("rollback failed: {}", e.what());
    }
}

void StoreTransaction::commit() {
    store_.commit();
    active_ = false;
}

void validate_schema(const Schema& schema, const LocalStore& store) {
    for (const auto& entity : schema.entities()) {
        auto columns = store.declared_columns(entity.dataset);
        if (!columns) {
            throw UnsupportedSchemaError{"store has no dataset '" + entity.dataset + "'"};
        }
        for (const auto& column : entity.columns) {
            if (std::ranges::find(*columns, column.name) == columns->end()) {
                throw UnsupportedSchemaError{"store dataset '" + entity.dataset +
                                             "' has no column '" + column.name + "'"};
            }
        }
    }
}

}  // namespace ledgersync
