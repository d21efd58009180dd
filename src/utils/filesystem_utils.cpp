#include <edi/utils/filesystem_utils.h>
#include <pwd.h>
#include <unistd.h>
#include <cstdlib>
#include <stdexcept>

namespace edi {
namespace utils {

namespace {
// Non-empty environment value, or nullptr.
const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    return (value && value[0] != '\0') ? value : nullptr;
}
} // namespace

// $HOME first; the passwd entry covers services started without one.
std::filesystem::path get_home_directory_path() {
    if (const char* home = env_value("HOME")) {
        return std::filesystem::path(home);
    }
    if (const struct passwd* pw = getpwuid(getuid()); pw && pw->pw_dir && pw->pw_dir[0] != '\0') {
        return std::filesystem::path(pw->pw_dir);
    }
    return {};
}

std::filesystem::path get_config_directory_path() {
    if (const char* xdg_config = env_value("XDG_CONFIG_HOME")) {
        return std::filesystem::path(xdg_config) / "edi";
    }
    const std::filesystem::path home = get_home_directory_path();
    if (home.empty()) {
        throw std::runtime_error("Cannot determine the home directory; set HOME or XDG_CONFIG_HOME");
    }
    return home / ".config" / "edi";
}

} // namespace utils
} // namespace edi
