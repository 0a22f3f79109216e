#include "save/SaveStore.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

namespace tickwell {

SaveStore::SaveStore(std::string filePath)
    : m_filePath(std::move(filePath)) {
}

void SaveStore::setFilePath(const std::string& filePath) {
    m_filePath = filePath;
    m_entries = nlohmann::json::object();
    m_loaded = false;
}

bool SaveStore::save(const std::string& key, const nlohmann::json& record) {
    ensureLoaded();

    if (!validateDepth(record, 0, MAX_NESTING_DEPTH)) {
        SAVE_LOG_WARN("SaveStore::save: record '{}' exceeds max nesting depth ({})", key, MAX_NESTING_DEPTH);
        return false;
    }

    nlohmann::json previous;
    bool hadPrevious = m_entries.contains(key);
    if (hadPrevious) previous = m_entries[key];

    m_entries[key] = record;

    size_t size = m_entries.dump().size();
    if (size > MAX_SAVE_FILE_SIZE) {
        // Revert the change
        if (hadPrevious) {
            m_entries[key] = std::move(previous);
        } else {
            m_entries.erase(key);
        }
        SAVE_LOG_WARN("SaveStore::save: record '{}' would exceed {} byte limit (attempted: {} bytes)",
                      key, MAX_SAVE_FILE_SIZE, size);
        return false;
    }

    return flush();
}

std::optional<nlohmann::json> SaveStore::load(const std::string& key) {
    ensureLoaded();
    auto it = m_entries.find(key);
    if (it == m_entries.end() || it->is_null()) {
        return std::nullopt;
    }
    return *it;
}

bool SaveStore::remove(const std::string& key) {
    ensureLoaded();
    if (m_entries.erase(key) == 0) {
        return false;
    }
    if (!flush()) {
        SAVE_LOG_WARN("SaveStore::remove: '{}' removed in memory but not flushed", key);
    }
    return true;
}

bool SaveStore::has(const std::string& key) {
    ensureLoaded();
    return m_entries.contains(key);
}

std::vector<std::string> SaveStore::keys() {
    ensureLoaded();
    std::vector<std::string> result;
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
        result.push_back(it.key());
    }
    return result;
}

bool SaveStore::flush() {
    if (m_filePath.empty()) return true;

    try {
        fs::path path(m_filePath);
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }
        if (fs::exists(path)) {
            fs::copy_file(path, backupPath(), fs::copy_options::overwrite_existing);
        }
    } catch (const std::exception& ex) {
        SAVE_LOG_WARN("SaveStore::flush: failed to back up '{}': {}", m_filePath, ex.what());
        // Continue saving anyway
    }

    nlohmann::json document = {
        {"version", SaveFormatVersion},
        {"entries", m_entries},
    };

    std::ofstream file(m_filePath);
    if (!file.is_open()) {
        SAVE_LOG_ERROR("SaveStore::flush: could not open '{}' for writing", m_filePath);
        return false;
    }
    file << document.dump(2);
    file.close();

    if (file.fail()) {
        SAVE_LOG_ERROR("SaveStore::flush: write error for '{}'", m_filePath);
        return false;
    }
    return true;
}

bool SaveStore::reload() {
    m_loaded = false;
    m_entries = nlohmann::json::object();
    ensureLoaded();
    return true;
}

void SaveStore::clear() {
    m_entries = nlohmann::json::object();
    m_loaded = true;
}

void SaveStore::registerSaveable(ISaveable* saveable) {
    if (!saveable) return;
    if (std::find(m_saveables.begin(), m_saveables.end(), saveable) != m_saveables.end()) return;
    m_saveables.push_back(saveable);
    saveable->load();
}

void SaveStore::unregisterSaveable(ISaveable* saveable) {
    auto it = std::find(m_saveables.begin(), m_saveables.end(), saveable);
    if (it != m_saveables.end()) {
        m_saveables.erase(it);
    }
}

void SaveStore::saveAll() {
    auto snapshot = m_saveables;
    for (ISaveable* saveable : snapshot) {
        saveable->save();
    }
}

void SaveStore::loadAll() {
    auto snapshot = m_saveables;
    for (ISaveable* saveable : snapshot) {
        saveable->load();
    }
}

void SaveStore::ensureLoaded() {
    if (m_loaded) return;
    m_loaded = true;
    m_entries = nlohmann::json::object();

    if (m_filePath.empty() || !fs::exists(m_filePath)) {
        return;
    }

    nlohmann::json entries;
    if (readFile(m_filePath, entries)) {
        m_entries = std::move(entries);
        return;
    }

    SAVE_LOG_WARN("SaveStore: '{}' unreadable, trying backup", m_filePath);
    if (fs::exists(backupPath()) && readFile(backupPath(), entries)) {
        m_entries = std::move(entries);
        SAVE_LOG_WARN("SaveStore: loaded '{}' from backup (primary file was corrupted)", m_filePath);
        return;
    }
    SAVE_LOG_ERROR("SaveStore: no usable save data at '{}', starting empty", m_filePath);
}

bool SaveStore::readFile(const std::string& path, nlohmann::json& entries) const {
    try {
        std::ifstream file(path);
        if (!file.is_open()) return false;

        nlohmann::json document = nlohmann::json::parse(file);
        if (!document.is_object()) return false;

        int version = document.value("version", 0);
        if (version != SaveFormatVersion) {
            SAVE_LOG_WARN("SaveStore: '{}' has version {} (expected {}), discarding",
                          path, version, SaveFormatVersion);
            entries = nlohmann::json::object();
            return true;
        }

        if (!document.contains("entries") || !document["entries"].is_object()) return false;
        entries = document["entries"];
        return true;
    } catch (const nlohmann::json::exception& ex) {
        SAVE_LOG_WARN("SaveStore: parse error in '{}': {}", path, ex.what());
        return false;
    } catch (const std::exception& ex) {
        SAVE_LOG_ERROR("SaveStore: error reading '{}': {}", path, ex.what());
        return false;
    }
}

bool SaveStore::validateDepth(const nlohmann::json& value, int currentDepth, int maxDepth) {
    if (currentDepth > maxDepth) return false;

    if (value.is_object() || value.is_array()) {
        for (const auto& elem : value) {
            if (!validateDepth(elem, currentDepth + 1, maxDepth)) {
                return false;
            }
        }
    }
    return true;
}

} // namespace tickwell
