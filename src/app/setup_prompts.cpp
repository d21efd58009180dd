#include <edi/app/setup_prompts.h>
#include <edi/app/config_store.h>
#include <edi/utils/text_utils.h>
#include <termios.h>
#include <unistd.h>
#include <iostream>
#include <stdexcept>

namespace edi {
namespace app {

namespace {

// Disables terminal echo for its lifetime. Does nothing when stdin is not a
// terminal or `active` is false.
class EchoDisabler {
public:
    explicit EchoDisabler(bool active) {
        if (!active || ::isatty(STDIN_FILENO) != 1) return;
        if (tcgetattr(STDIN_FILENO, &m_original) != 0) return;
        termios silent = m_original;
        silent.c_lflag &= static_cast<tcflag_t>(~ECHO);
        if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) == 0) {
            m_active = true;
        }
    }

    ~EchoDisabler() {
        if (m_active) {
            tcsetattr(STDIN_FILENO, TCSAFLUSH, &m_original);
        }
    }

    EchoDisabler(const EchoDisabler&) = delete;
    EchoDisabler& operator=(const EchoDisabler&) = delete;

    bool active() const { return m_active; }

private:
    termios m_original{};
    bool m_active = false;
};

} // namespace

std::string promptApiKey(std::istream& in, std::ostream& out) {
    while (true) {
        out << "Enter your Poe API key.\n"
               "No characters will be displayed as you type.\n"
               "Press Enter when done.\n";
        out.flush();

        std::string api_key;
        bool got_line = false;
        {
            EchoDisabler no_echo(&in == &std::cin);
            got_line = static_cast<bool>(std::getline(in, api_key));
            if (no_echo.active()) {
                out << '\n'; // The user's Enter was not echoed.
            }
        }
        if (!got_line) {
            throw std::runtime_error("Input ended before an API key was entered");
        }

        api_key = utils::trim(api_key);
        if (api_key.size() == kApiKeyLength) {
            return api_key;
        }
        out << "Invalid API key length. Expected " << kApiKeyLength << " characters.\n";
    }
}

std::string promptModel(std::istream& in, std::ostream& out) {
    const auto& models = availableModels();
    out << "Available models:\n";
    for (size_t i = 0; i < models.size(); ++i) {
        out << (i + 1) << ": " << models[i] << '\n';
    }
    out << "Select a model by number: ";
    out.flush();

    std::string line;
    if (std::getline(in, line)) {
        try {
            size_t consumed = 0;
            std::string choice_text = utils::trim(line);
            long choice = std::stol(choice_text, &consumed);
            if (consumed == choice_text.size() && choice >= 1 && choice <= static_cast<long>(models.size())) {
                return models[static_cast<size_t>(choice - 1)];
            }
        } catch (const std::logic_error&) {
            // Not a number (std::invalid_argument) or too large (std::out_of_range).
        }
    }
    out << "Invalid choice, defaulting to " << defaultModel() << ".\n";
    return defaultModel();
}

} // namespace app
} // namespace edi
