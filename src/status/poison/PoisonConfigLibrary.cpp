#include "status/poison/PoisonConfigLibrary.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

namespace tickwell {

bool PoisonConfigLibrary::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("PoisonConfigLibrary: could not open '{}'", path);
        return false;
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& ex) {
        LOG_WARN("PoisonConfigLibrary: parse error in '{}': {}", path, ex.what());
        return false;
    }
    return loadFromJson(json);
}

bool PoisonConfigLibrary::loadFromJson(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("poisons") || !json["poisons"].is_array()) {
        LOG_WARN("PoisonConfigLibrary: no 'poisons' array in JSON");
        return false;
    }

    int count = 0;
    for (const auto& entry : json["poisons"]) {
        if (!entry.is_object()) continue;
        try {
            if (registerConfig(entry.get<PoisonConfig>())) {
                ++count;
            }
        } catch (const nlohmann::json::exception& ex) {
            LOG_WARN("PoisonConfigLibrary: skipping malformed poison entry: {}", ex.what());
        }
    }

    LOG_INFO("PoisonConfigLibrary: loaded {} poison configs", count);
    return true;
}

bool PoisonConfigLibrary::registerConfig(const PoisonConfig& config) {
    std::string key = normalizeId(config.id);
    if (key.empty()) {
        LOG_WARN("PoisonConfigLibrary: poison config missing 'id'");
        return false;
    }
    if (m_configs.count(key)) {
        LOG_WARN("PoisonConfigLibrary: overwriting poison config '{}'", key);
    }
    m_configs[key] = config;
    m_missing.erase(key);
    return true;
}

const PoisonConfig* PoisonConfigLibrary::resolve(const std::string& id) const {
    std::string key = normalizeId(id);
    if (key.empty()) return nullptr;

    auto it = m_configs.find(key);
    if (it != m_configs.end()) {
        return &it->second;
    }

    if (m_missing.insert(key).second) {
        LOG_ERROR("PoisonConfigLibrary: poison config '{}' could not be resolved", id);
    }
    return nullptr;
}

bool PoisonConfigLibrary::isCanonical(const std::string& id) const {
    return normalizeId(id) == normalizeId(m_canonicalId);
}

void PoisonConfigLibrary::clear() {
    m_configs.clear();
    m_missing.clear();
}

std::string PoisonConfigLibrary::normalizeId(const std::string& id) {
    auto begin = std::find_if_not(id.begin(), id.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(id.rbegin(), id.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end) return {};

    std::string result(begin, end);
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace tickwell
