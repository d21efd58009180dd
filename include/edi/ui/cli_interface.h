#pragma once

#include <edi/ui/ui_interface.h>
#include <iosfwd>
#include <optional>
#include <string>

namespace edi {
namespace ui {

// Concrete implementation of UserInterface for a command-line environment.
class CliInterface : public UserInterface {
public:
    // `interactive` decides between readline and plain stream reads.
    // `verbose` enables [Status] lines.
    CliInterface(bool interactive, bool verbose);
    CliInterface(std::istream& in, std::ostream& out, std::ostream& err, bool interactive, bool verbose);
    ~CliInterface() override = default;

    std::optional<std::string> promptUserInput() override;
    std::string readPipedInput() override;
    bool confirm(const std::string& question) override;
    void displayOutput(const std::string& output) override;
    void displayError(const std::string& error) override;
    void displayStatus(const std::string& status) override;
    void displayProgress(const std::string& fragment) override;
    bool isInteractive() const override;

private:
    // Reads a single line; std::nullopt on end of input.
    std::optional<std::string> readLine(const char* prompt);

    std::istream& m_in;
    std::ostream& m_out;
    std::ostream& m_err;
    bool m_interactive;
    bool m_verbose;
    bool m_use_readline;
};

// True when stdin is attached to a terminal.
bool stdinIsTerminal();

} // namespace ui
} // namespace edi
