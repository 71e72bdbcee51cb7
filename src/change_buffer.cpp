#include <ledgersync/change_buffer.hpp>
#include <ledgersync/error.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace ledgersync {

void ChangeBuffer::record(std::string_view dataset, std::string_view row,
                          std::string_view column, ScalarValue value) {
    auto key = CellKey{dataset, row, column};
    if (auto it = index_.find(key); it != index_.end()) {
        pending_[it->second].value = std::move(value);
        return;
    }
    index_.emplace(std::move(key), pending_.size());
    pending_.push_back(PendingEdit{
        .dataset = std::string{dataset},
        .row = std::string{row},
        .column = std::string{column},
        .value = std::move(value),
    });
}

void ChangeBuffer::record_entity(std::string_view dataset, std::string_view row,
                                 const Attributes& attributes) {
    for (const auto& [column, value] : attributes) {
        record(dataset, row, column, value);
    }
}

auto ChangeBuffer::pending_attributes(std::string_view dataset, std::string_view row) const
    -> Attributes {
    auto attributes = Attributes{};
    for (const auto& edit : pending_) {
        if (edit.dataset == dataset && edit.row == row) {
            attributes.insert_or_assign(edit.column, edit.value);
        }
    }
    return attributes;
}

auto ChangeBuffer::pending_rows(std::string_view dataset) const -> std::vector<std::string> {
    auto rows = std::vector<std::string>{};
    for (const auto& edit : pending_) {
        if (edit.dataset == dataset && std::ranges::find(rows, edit.row) == rows.end()) {
            rows.push_back(edit.row);
        }
    }
    return rows;
}

auto ChangeBuffer::flush(LogicalClock& clock) -> ChangeSet {
    if (in_transaction()) {
        throw Error{ErrorKind::invalid_operation,
                    "cannot flush change buffer inside an open transaction"};
    }

    auto records = ChangeSet{};
    records.reserve(pending_.size());
    for (const auto& edit : pending_) {
        records.push_back(ChangeRecord{
            .dataset = edit.dataset,
            .row = edit.row,
            .column = edit.column,
            .value = edit.value,
            .timestamp = clock.now(),
        });
    }

    SPDLOG_DEBUG("flushed {} buffered edit(s)", records.size());
    discard();
    return records;
}

void ChangeBuffer::discard() {
    pending_.clear();
    index_.clear();
}

void ChangeBuffer::begin_transaction() {
    ++transaction_depth_;
}

void ChangeBuffer::end_transaction() {
    if (transaction_depth_ == 0) {
        throw Error{ErrorKind::invalid_operation, "no open transaction"};
    }
    --transaction_depth_;
}

}  // namespace ledgersync
