#include <ledgersync/merge_applier.hpp>
#include <ledgersync/error.hpp>
#include <ledgersync/json.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace ledgersync {

namespace {

// Columns accumulated for one run of records sharing (dataset, row).
struct PendingWrite {
    std::string dataset;
    std::string row;
    Attributes attributes;

    auto matches(const ChangeRecord& record) const -> bool {
        return dataset == record.dataset && row == record.row;
    }
};

void write_group(LocalStore& store, PendingWrite& group) {
    if (group.attributes.empty()) return;
    store.get_or_create(group.dataset, group.row);
    store.update(group.dataset, group.row, group.attributes);
    SPDLOG_DEBUG("wrote {} column(s) to {}/{}", group.attributes.size(),
                 group.dataset, group.row);
    group.attributes.clear();
}

}  // anonymous namespace

MergeApplier::MergeApplier(const Schema& schema, LocalStore& store, MetadataStore& metadata)
    : schema_{schema}, store_{store}, metadata_{metadata} {}

auto MergeApplier::apply(std::span<const ChangeRecord> records) -> ApplyStats {
    return apply_batch(records, false);
}

auto MergeApplier::apply_local(std::span<const ChangeRecord> records) -> ApplyStats {
    return apply_batch(records, true);
}

auto MergeApplier::apply_batch(std::span<const ChangeRecord> records, bool queue_outgoing)
    -> ApplyStats {
    auto stats = ApplyStats{};
    auto prefs = nlohmann::json::object();
    auto group = PendingWrite{};

    auto txn = StoreTransaction{store_};
    for (const auto& record : records) {
        if (record.dataset == prefs_dataset) {
            prefs[record.row] = record.value;
            ++stats.prefs;
            continue;
        }

        if (!schema_.find(record.dataset)) {
            throw UnsupportedSchemaError{"unknown dataset '" + record.dataset + "'"};
        }
        if (!schema_.resolve_column(record.dataset, record.column)) {
            throw UnsupportedSchemaError{"unknown column '" + record.column +
                                         "' in dataset '" + record.dataset + "'"};
        }

        if (!group.matches(record)) {
            write_group(store_, group);
            group.dataset = record.dataset;
            group.row = record.row;
        }

        auto last = store_.cell_timestamp(record.dataset, record.row, record.column);
        if (last && !(*last < record.timestamp)) {
            SPDLOG_DEBUG("skipping stale write to {}/{}.{}", record.dataset, record.row,
                         record.column);
            ++stats.skipped;
            continue;
        }

        group.attributes.insert_or_assign(record.column, record.value);
        store_.record_message(record);
        ++stats.applied;
    }
    write_group(store_, group);
    if (queue_outgoing) store_.queue_outgoing(records);
    txn.commit();

    if (!prefs.empty()) {
        metadata_.patch(prefs);
    }

    SPDLOG_INFO("applied {} record(s), skipped {}, {} preference(s)",
                stats.applied, stats.skipped, stats.prefs);
    return stats;
}

}  // namespace ledgersync
