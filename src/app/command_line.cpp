#include <edi/app/command_line.h>

namespace edi {
namespace app {

CommandLineOptions parseCommandLine(const std::vector<std::string>& args) {
    CommandLineOptions options;
    for (const auto& arg : args) {
        if (arg == "--continue") {
            options.continue_session = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else if (arg == "--version") {
            options.show_version = true;
        } else {
            options.error = "unrecognized argument: " + arg;
            break;
        }
    }
    return options;
}

std::string usageText(const std::string& program_name) {
    return "usage: " + program_name + " [-h] [--continue] [-v] [--version]\n"
           "\n"
           "Chat with a Poe model from the terminal. Finish a message with a blank\n"
           "line or Ctrl-D; a blank message ends the chat. Piped input is sent as a\n"
           "single message.\n"
           "\n"
           "options:\n"
           "  -h, --help     show this help message and exit\n"
           "  --continue     Continue the previous session\n"
           "  -v, --verbose  Show status messages\n"
           "  --version      Show the version and exit\n";
}

} // namespace app
} // namespace edi
