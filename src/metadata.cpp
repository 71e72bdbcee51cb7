#include <ledgersync/metadata.hpp>
#include <ledgersync/error.hpp>

#include <spdlog/spdlog.h>

#include <fstream>
#include <utility>

namespace ledgersync {

namespace {

void merge_into(nlohmann::json& document, const nlohmann::json& values) {
    if (!values.is_object()) {
        throw Error{ErrorKind::invalid_operation, "metadata patch must be an object"};
    }
    for (const auto& [key, value] : values.items()) {
        document[key] = value;
    }
}

}  // anonymous namespace

// -- MemoryMetadataStore ------------------------------------------------------

MemoryMetadataStore::MemoryMetadataStore(nlohmann::json initial)
    : document_{std::move(initial)} {
    if (!document_.is_object()) document_ = nlohmann::json::object();
}

void MemoryMetadataStore::patch(const nlohmann::json& values) {
    merge_into(document_, values);
}

// -- JsonFileMetadataStore ----------------------------------------------------

JsonFileMetadataStore::JsonFileMetadataStore(std::filesystem::path path)
    : path_{std::move(path)} {}

auto JsonFileMetadataStore::get() const -> nlohmann::json {
    auto in = std::ifstream{path_};
    if (!in) return nlohmann::json::object();

    auto document = nlohmann::json::parse(in, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        throw StoreError{"metadata file is not a JSON object: " + path_.string()};
    }
    return document;
}

void JsonFileMetadataStore::patch(const nlohmann::json& values) {
    auto document = get();
    merge_into(document, values);

    auto out = std::ofstream{path_, std::ios::trunc};
    if (!out) throw StoreError{"cannot write metadata file: " + path_.string()};
    out << document.dump();
    if (!out) throw StoreError{"failed writing metadata file: " + path_.string()};
    SPDLOG_DEBUG("patched {} key(s) in {}", values.size(), path_.string());
}

}  // namespace ledgersync
