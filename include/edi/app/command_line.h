#pragma once

#include <string>
#include <vector>

namespace edi {
namespace app {

struct CommandLineOptions {
    bool continue_session = false;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;
    std::string error; // Non-empty when the arguments could not be parsed
};

// Parses argv[1..]. Never throws; unknown arguments are reported in `error`.
CommandLineOptions parseCommandLine(const std::vector<std::string>& args);

std::string usageText(const std::string& program_name);

} // namespace app
} // namespace edi
