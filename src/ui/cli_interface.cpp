#include <edi/ui/cli_interface.h>
#include <edi/utils/text_utils.h>
#include <readline/readline.h>
#include <readline/history.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cstdlib> // For free()
#include <iostream>
#include <iterator>
#include <vector>

namespace edi {
namespace ui {

namespace {
constexpr const char* kInputPrompt = ">>> \n";
} // namespace

bool stdinIsTerminal() {
    return ::isatty(STDIN_FILENO) == 1;
}

CliInterface::CliInterface(bool interactive, bool verbose)
    : m_in(std::cin), m_out(std::cout), m_err(std::cerr),
      m_interactive(interactive), m_verbose(verbose), m_use_readline(interactive) {}

CliInterface::CliInterface(std::istream& in, std::ostream& out, std::ostream& err, bool interactive, bool verbose)
    : m_in(in), m_out(out), m_err(err),
      m_interactive(interactive), m_verbose(verbose), m_use_readline(false) {}

// Readline provides line editing and history (up/down arrows) on a terminal.
// Other streams are read with std::getline.
std::optional<std::string> CliInterface::readLine(const char* prompt) {
    if (m_use_readline) {
        char* input_cstr = readline(prompt);
        if (!input_cstr) {
            return std::nullopt; // Ctrl-D
        }
        std::string line(input_cstr);
        free(input_cstr); // Free memory allocated by readline
        if (!line.empty()) {
            add_history(line.c_str());
        }
        return line;
    }

    m_out << prompt;
    m_out.flush();
    std::string line;
    if (!std::getline(m_in, line)) {
        return std::nullopt;
    }
    return line;
}

std::optional<std::string> CliInterface::promptUserInput() {
    m_out << kInputPrompt;
    m_out.flush();

    std::vector<std::string> lines;
    while (true) {
        auto line = readLine("");
        if (!line) {
            break;
        }
        if (utils::trim(*line).empty()) {
            break;
        }
        lines.push_back(std::move(*line));
    }
    if (lines.empty()) {
        // Either Ctrl-D straight away or a blank first line; both end the chat.
        return std::nullopt;
    }

    std::string joined;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined += '\n';
        }
        joined += lines[i];
    }
    return joined;
}

std::string CliInterface::readPipedInput() {
    std::string content{std::istreambuf_iterator<char>(m_in), std::istreambuf_iterator<char>()};
    return utils::trim(content);
}

bool CliInterface::confirm(const std::string& question) {
    auto answer = readLine(question.c_str());
    if (!answer) {
        m_out << '\n';
        return false;
    }
    std::string normalized = utils::trim(*answer);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized == "y";
}

// Ensures output ends with a newline for proper formatting.
void CliInterface::displayOutput(const std::string& output) {
    m_out << output;
    if (output.empty() || output.back() != '\n') {
        m_out << '\n';
    }
    m_out.flush();
}

// Prefixes with "Error: " and ensures output ends with a newline.
void CliInterface::displayError(const std::string& error) {
    m_err << "Error: " << error;
    if (error.empty() || error.back() != '\n') {
        m_err << '\n';
    }
    m_err.flush();
}

void CliInterface::displayStatus(const std::string& status) {
    if (!m_verbose) {
        return;
    }
    m_err << "[Status] " << status;
    if (status.empty() || status.back() != '\n') {
        m_err << '\n';
    }
    m_err.flush();
}

void CliInterface::displayProgress(const std::string& fragment) {
    m_out << fragment;
    m_out.flush();
}

bool CliInterface::isInteractive() const {
    return m_interactive;
}

} // namespace ui
} // namespace edi
