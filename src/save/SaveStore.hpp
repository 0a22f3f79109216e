#pragma once

#include "save/ISaveable.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tickwell {

/// Version tag written into every save file
constexpr int SaveFormatVersion = 1;

/// Maximum serialized size of the whole save file (4 MB)
constexpr size_t MAX_SAVE_FILE_SIZE = 4 * 1024 * 1024;

/// Maximum nesting depth for stored records
constexpr int MAX_NESTING_DEPTH = 8;

/// String-keyed JSON record store.
///
/// All records live in one file:
///   { "version": 1, "entries": { "<key>": <record>, ... } }
/// Every write is flushed immediately; the previous file is kept as a
/// `.bak` copy and used when the primary file is corrupt. A file written
/// with a different version is discarded (logged) rather than migrated.
///
/// With no file path the store is purely in-memory.
class SaveStore {
public:
    SaveStore() = default;
    explicit SaveStore(std::string filePath);

    SaveStore(const SaveStore&) = delete;
    SaveStore& operator=(const SaveStore&) = delete;

    /// Change the backing file. Cached records are dropped and the new
    /// file is read on next access.
    void setFilePath(const std::string& filePath);
    const std::string& getFilePath() const { return m_filePath; }

    // ========================================================================
    // Records
    // ========================================================================

    /// Store a record and flush.
    /// @return false if the record is too deep or would exceed the size limit
    bool save(const std::string& key, const nlohmann::json& record);

    /// Fetch a record (std::nullopt if absent)
    std::optional<nlohmann::json> load(const std::string& key);

    /// Delete a record and flush. No-op if absent.
    /// @return true if the key existed
    bool remove(const std::string& key);

    bool has(const std::string& key);
    std::vector<std::string> keys();

    /// Write all records to disk. No-op for in-memory stores.
    bool flush();

    /// Drop cached records and re-read the file
    bool reload();

    /// Drop all records (does not touch the file until the next write)
    void clear();

    // ========================================================================
    // Saveable participants
    // ========================================================================

    /// Register a participant; it loads immediately. Duplicates are ignored.
    void registerSaveable(ISaveable* saveable);
    void unregisterSaveable(ISaveable* saveable);
    size_t saveableCount() const { return m_saveables.size(); }

    /// Ask every registered participant to save / load
    void saveAll();
    void loadAll();

private:
    void ensureLoaded();
    bool readFile(const std::string& path, nlohmann::json& entries) const;
    std::string backupPath() const { return m_filePath + ".bak"; }

    static bool validateDepth(const nlohmann::json& value, int currentDepth, int maxDepth);

    std::string m_filePath;
    nlohmann::json m_entries = nlohmann::json::object();
    bool m_loaded = false;
    std::vector<ISaveable*> m_saveables;
};

} // namespace tickwell
