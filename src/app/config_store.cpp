#include <edi/app/config_store.h>
#include <edi/config.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace edi {
namespace app {

const std::vector<std::string>& availableModels() {
    static const std::vector<std::string> models = {
        "Assistant",
        "Web-Search",
        "Claude-Opus-4.1",
        "Claude-Sonnet-4",
        "GPT-5",
        "GPT-5-Chat",
        "GPT-5-mini",
        "Gemini-2.5-Pro",
        "Grok-4",
    };
    return models;
}

const std::string& defaultModel() {
    const auto& models = availableModels();
    auto it = std::find(models.begin(), models.end(), EDI_DEFAULT_MODEL);
    return it != models.end() ? *it : models.front();
}

ConfigStore::ConfigStore(std::filesystem::path path) : m_path(std::move(path)) {}

std::optional<AppConfig> ConfigStore::load() const {
    std::ifstream in(m_path);
    if (!in) {
        return std::nullopt;
    }
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        AppConfig config;
        config.api_key = j.at("api_key").get<std::string>();
        config.model = j.at("model").get<std::string>();
        if (config.api_key.empty() || config.model.empty()) {
            return std::nullopt;
        }
        return config;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

void ConfigStore::save(const AppConfig& config) const {
    std::error_code ec;
    if (m_path.has_parent_path()) {
        std::filesystem::create_directories(m_path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Failed to create config directory " + m_path.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream out(m_path, std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to open config file for writing: " + m_path.string());
    }
    nlohmann::json j = {{"api_key", config.api_key}, {"model", config.model}};
    out << j.dump();
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write config file: " + m_path.string());
    }

    // The file holds a credential.
    std::filesystem::permissions(m_path,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        throw std::runtime_error("Failed to restrict permissions of " + m_path.string() + ": " + ec.message());
    }
}

AppConfig applyEnvironmentOverrides(AppConfig config) {
    const char* env_key = std::getenv("EDI_API_KEY");
    if (env_key && env_key[0] != '\0') {
        config.api_key = env_key;
    }
    return config;
}

std::string resolveApiBaseUrl() {
    const char* env_base = std::getenv("EDI_API_BASE");
    if (env_base && env_base[0] != '\0') {
        return std::string(env_base);
    }
    return EDI_API_BASE_URL;
}

} // namespace app
} // namespace edi
