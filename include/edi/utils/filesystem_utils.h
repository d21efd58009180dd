#ifndef EDI_UTILS_FILESYSTEM_UTILS_H
#define EDI_UTILS_FILESYSTEM_UTILS_H

#include <filesystem>

namespace edi {
namespace utils {
    // The user's home directory: $HOME, else the passwd entry of the current user
    // Returns an empty path if the home directory cannot be determined
    std::filesystem::path get_home_directory_path();

    // Directory holding edi's config and session files:
    // $XDG_CONFIG_HOME/edi, falling back to ~/.config/edi.
    // Throws std::runtime_error when neither location can be determined.
    std::filesystem::path get_config_directory_path();
}
}

#endif // EDI_UTILS_FILESYSTEM_UTILS_H
