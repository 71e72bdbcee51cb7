#include <ledgersync/json.hpp>
#include <ledgersync/error.hpp>

#include "util/base64.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace ledgersync {

// -- ScalarValue --------------------------------------------------------------

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const ScalarValue& sv) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](double d) { j = d; },
        [&](const std::string& s) { j = s; },
    }, sv);
}

void from_json(const nlohmann::json& j, ScalarValue& sv) {
    if (j.is_null()) {
        sv = Null{};
    } else if (j.is_boolean()) {
        sv = j.get<bool>();
    } else if (j.is_number_unsigned()) {
        auto val = j.get<std::uint64_t>();
        if (val > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw DecodeError{"integer out of range: " + std::to_string(val)};
        }
        sv = static_cast<std::int64_t>(val);
    } else if (j.is_number_integer()) {
        sv = j.get<std::int64_t>();
    } else if (j.is_number_float()) {
        sv = j.get<double>();
    } else if (j.is_string()) {
        sv = j.get<std::string>();
    } else {
        throw DecodeError{"not a scalar: " + j.dump()};
    }
}

// -- LogicalTimestamp ---------------------------------------------------------

void to_json(nlohmann::json& j, const LogicalTimestamp& ts) {
    j = to_string(ts);
}

void from_json(const nlohmann::json& j, LogicalTimestamp& ts) {
    auto parsed = parse_timestamp(j.get<std::string>());
    if (!parsed) throw DecodeError{"malformed timestamp: " + j.dump()};
    ts = std::move(*parsed);
}

// -- ReplicaClock -------------------------------------------------------------

void to_json(nlohmann::json& j, const ReplicaClock& clock) {
    j = nlohmann::json{{"timestamp", clock.last}};
}

void from_json(const nlohmann::json& j, ReplicaClock& clock) {
    auto last = j.at("timestamp").get<LogicalTimestamp>();
    clock.client_id = last.client_id;
    clock.last = std::move(last);
}

// -- EncryptionMeta -----------------------------------------------------------

void to_json(nlohmann::json& j, const EncryptionMeta& meta) {
    j = nlohmann::json{
        {"keyId", meta.key_id},
        {"algorithm", meta.algorithm},
        {"iv", util::base64_encode(meta.iv)},
        {"authTag", util::base64_encode(meta.auth_tag)},
    };
}

void from_json(const nlohmann::json& j, EncryptionMeta& meta) {
    meta.key_id = j.at("keyId").get<std::string>();
    meta.algorithm = j.value("algorithm", std::string{aead_algorithm});
    meta.iv = util::base64_decode(j.at("iv").get<std::string>());
    meta.auth_tag = util::base64_decode(j.at("authTag").get<std::string>());
}

// -- ChangeRecord -------------------------------------------------------------

void to_json(nlohmann::json& j, const ChangeRecord& record) {
    j = nlohmann::json{
        {"dataset", record.dataset},
        {"row", record.row},
        {"column", record.column},
        {"value", record.value},
        {"timestamp", record.timestamp},
    };
}

void from_json(const nlohmann::json& j, ChangeRecord& record) {
    record.dataset = j.at("dataset").get<std::string>();
    record.row = j.at("row").get<std::string>();
    record.column = j.at("column").get<std::string>();
    record.value = j.at("value").get<ScalarValue>();
    record.timestamp = j.at("timestamp").get<LogicalTimestamp>();
}

}  // namespace ledgersync
