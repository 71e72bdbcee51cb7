/// @file metadata.hpp
/// @brief MetadataStore: the replica's preference document (metadata.json).

#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>

namespace ledgersync {

/// A flat JSON object of replica preferences.
///
/// Receives replicated `prefs` records and holds the replica config.
class MetadataStore {
public:
    virtual ~MetadataStore() = default;

    /// The whole document (an object, empty if nothing was written).
    virtual auto get() const -> nlohmann::json = 0;

    /// Merge the keys of an object into the document, replacing existing
    /// values.
    /// @throws StoreError if the document cannot be written.
    virtual void patch(const nlohmann::json& values) = 0;
};

/// Metadata kept in memory.
class MemoryMetadataStore : public MetadataStore {
public:
    MemoryMetadataStore() = default;
    explicit MemoryMetadataStore(nlohmann::json initial);

    auto get() const -> nlohmann::json override { return document_; }
    void patch(const nlohmann::json& values) override;

private:
    nlohmann::json document_ = nlohmann::json::object();
};

/// Metadata persisted as a compact JSON file.
///
/// Each patch reads the current file, merges and rewrites it.
class JsonFileMetadataStore : public MetadataStore {
public:
    explicit JsonFileMetadataStore(std::filesystem::path path);

    /// @throws StoreError if the file exists but is not a JSON object.
    auto get() const -> nlohmann::json override;
    void patch(const nlohmann::json& values) override;

    auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace ledgersync
