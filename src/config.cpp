#include <ledgersync/config.hpp>

namespace ledgersync {

namespace {

auto optional_string(const nlohmann::json& j, const char* key) -> std::optional<std::string> {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

}  // anonymous namespace

auto ReplicaConfig::from_metadata(const nlohmann::json& metadata) -> ReplicaConfig {
    auto config = ReplicaConfig{};
    if (!metadata.is_object()) return config;
    config.file_id = optional_string(metadata, "cloudFileId").value_or("");
    config.group_id = optional_string(metadata, "groupId");
    config.key_id = optional_string(metadata, "encryptKeyId");
    return config;
}

auto ReplicaConfig::to_metadata() const -> nlohmann::json {
    auto j = nlohmann::json::object();
    j["cloudFileId"] = file_id;
    j["groupId"] = group_id ? nlohmann::json(*group_id) : nlohmann::json(nullptr);
    j["encryptKeyId"] = key_id ? nlohmann::json(*key_id) : nlohmann::json(nullptr);
    return j;
}

}  // namespace ledgersync
