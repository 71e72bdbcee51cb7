/// @file change.hpp
/// @brief ChangeRecord: one timestamped field assignment, the unit of replication.

#pragma once

#include <ledgersync/types.hpp>
#include <ledgersync/value.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace ledgersync {

/// The dataset name reserved for replicated preferences.
///
/// Records in this dataset are not entity mutations: `row` names a key in
/// the metadata store and `value` is written to it.
inline constexpr std::string_view prefs_dataset = "prefs";

/// A last-writer-wins assignment of one field on one entity.
///
/// Records are immutable once issued. The same (dataset, row, column)
/// may appear many times in the history; the record with the highest
/// timestamp is authoritative.
struct ChangeRecord {
    std::string dataset;         ///< Table the entity lives in.
    std::string row;             ///< Entity id.
    std::string column;          ///< Field being assigned.
    ScalarValue value;           ///< New field value.
    LogicalTimestamp timestamp;  ///< When and by whom the write happened.

    auto operator==(const ChangeRecord&) const -> bool = default;
};

/// An ordered sequence of change records.
using ChangeSet = std::vector<ChangeRecord>;

}  // namespace ledgersync
