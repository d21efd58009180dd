#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace edi {
namespace app {

// Length of a Poe API key.
constexpr std::size_t kApiKeyLength = 43;

// Models offered by the setup menu, in menu order.
const std::vector<std::string>& availableModels();

// The catalogue entry named by EDI_DEFAULT_MODEL, or the first entry when the
// configured name is not in the catalogue.
const std::string& defaultModel();

struct AppConfig {
    std::string api_key;
    std::string model;
};

/*
 * Manages the {"api_key", "model"} JSON file written by first-time setup.
 */
class ConfigStore {
public:
    explicit ConfigStore(std::filesystem::path path);

    /// Returns std::nullopt when the file is missing, unreadable or lacks a field.
    std::optional<AppConfig> load() const;

    /// Writes the config, creating the directory. Throws std::runtime_error on failure.
    void save(const AppConfig& config) const;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

// Returns `config` with the key replaced by $EDI_API_KEY when that is set and non-empty.
AppConfig applyEnvironmentOverrides(AppConfig config);

// Endpoint base URL: $EDI_API_BASE when set and non-empty, else the compiled default.
std::string resolveApiBaseUrl();

} // namespace app
} // namespace edi
