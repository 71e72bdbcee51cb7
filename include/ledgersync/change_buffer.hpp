/// @file change_buffer.hpp
/// @brief ChangeBuffer: coalescing queue of local edits awaiting timestamps.

#pragma once

#include <ledgersync/change.hpp>
#include <ledgersync/clock.hpp>
#include <ledgersync/store.hpp>
#include <ledgersync/value.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace ledgersync {

/// Buffered field writes of one editing session.
///
/// Writes are keyed by (dataset, row, column). A repeated write to a key
/// replaces the pending value in place, so the key keeps the position of
/// its first write. No timestamp is issued until flush(), which stamps
/// entries in that order with strictly increasing timestamps.
///
/// @code
/// auto buffer = ChangeBuffer{};
/// buffer.record("transactions", id, "amount", std::int64_t{-1200});
/// buffer.record("transactions", id, "notes", std::string{"lunch"});
/// auto records = buffer.flush(clock);  // two records, ascending timestamps
/// @endcode
class ChangeBuffer {
public:
    /// Buffer one field write.
    void record(std::string_view dataset, std::string_view row, std::string_view column,
                ScalarValue value);

    /// Buffer every attribute of an entity, in attribute order.
    void record_entity(std::string_view dataset, std::string_view row,
                       const Attributes& attributes);

    /// Stamp and drain the buffer.
    /// @throws Error(invalid_operation) while a transaction is open.
    /// @throws ClockError if the clock counter overflows; the buffer is
    ///         left intact.
    auto flush(LogicalClock& clock) -> ChangeSet;

    /// Drop every pending write (abort the editing session).
    void discard();

    /// Pending values for one row, in column order. Empty if none.
    auto pending_attributes(std::string_view dataset, std::string_view row) const -> Attributes;

    /// Rows of a dataset with pending writes, in order of first write.
    auto pending_rows(std::string_view dataset) const -> std::vector<std::string>;

    auto size() const -> std::size_t { return pending_.size(); }
    auto empty() const -> bool { return pending_.empty(); }

    // -- Transaction gating ---------------------------------------------------

    /// Mark the start of a local database transaction. Nests.
    void begin_transaction();

    /// Mark the end of the innermost open transaction.
    /// @throws Error(invalid_operation) if none is open.
    void end_transaction();

    auto in_transaction() const -> bool { return transaction_depth_ > 0; }

private:
    struct PendingEdit {
        std::string dataset;
        std::string row;
        std::string column;
        ScalarValue value;
    };

    using CellKey = std::tuple<std::string, std::string, std::string>;

    std::vector<PendingEdit> pending_;
    std::map<CellKey, std::size_t> index_;
    int transaction_depth_ = 0;
};

}  // namespace ledgersync
