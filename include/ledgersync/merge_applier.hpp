/// @file merge_applier.hpp
/// @brief MergeApplier: writes ordered change records into the local store.

#pragma once

#include <ledgersync/change.hpp>
#include <ledgersync/metadata.hpp>
#include <ledgersync/schema.hpp>
#include <ledgersync/store.hpp>

#include <cstddef>
#include <span>

namespace ledgersync {

/// Outcome counters of one apply() call.
struct ApplyStats {
    std::size_t applied = 0;  ///< Records written to entity rows.
    std::size_t skipped = 0;  ///< Records not newer than the cell's last write.
    std::size_t prefs = 0;    ///< Records routed to the metadata store.

    auto operator==(const ApplyStats&) const -> bool = default;
};

/// Applies change records with field-level last-writer-wins semantics.
///
/// Consecutive records for the same (dataset, row) are accumulated and
/// written with one update. A record is applied only if its timestamp is
/// newer than the last one applied to the same cell, so re-delivering a
/// batch, or a suffix of one, changes nothing. Records in the `prefs`
/// dataset bypass the relational store and patch the metadata store.
///
/// The whole call is atomic: it runs in one StoreTransaction and the
/// metadata patch is written only after the commit succeeds.
class MergeApplier {
public:
    MergeApplier(const Schema& schema, LocalStore& store, MetadataStore& metadata);

    /// Apply records in the given order.
    /// @throws UnsupportedSchemaError on an unknown dataset or column; the
    ///         store is left as it was.
    /// @throws StoreError if the store fails; the store is left as it was.
    auto apply(std::span<const ChangeRecord> records) -> ApplyStats;

    /// Apply records issued by this replica and queue them for the relay
    /// in the same transaction.
    auto apply_local(std::span<const ChangeRecord> records) -> ApplyStats;

private:
    auto apply_batch(std::span<const ChangeRecord> records, bool queue_outgoing) -> ApplyStats;

    const Schema& schema_;
    LocalStore& store_;
    MetadataStore& metadata_;
};

}  // namespace ledgersync
