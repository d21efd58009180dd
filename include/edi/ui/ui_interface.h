#pragma once

#include <optional>
#include <string>

namespace edi {
namespace ui {

// Abstract base class defining the contract for user interaction.
// The chat loop only talks to the terminal through this interface, which keeps
// it testable with a scripted implementation.
class UserInterface {
public:
    // Reads one user turn. Lines are collected until a blank line or end of
    // input and joined with '\n'.
    // Returns std::nullopt if end of input is reached before any line.
    virtual std::optional<std::string> promptUserInput() = 0;

    // Reads everything available on a non-interactive input, trimmed.
    virtual std::string readPipedInput() = 0;

    // Asks a yes/no question; only "y" counts as yes.
    virtual bool confirm(const std::string& question) = 0;

    // Displays conversation output to the user.
    virtual void displayOutput(const std::string& output) = 0;

    // Displays error messages to the user.
    virtual void displayError(const std::string& error) = 0;

    // Displays diagnostic status messages (only visible in verbose mode).
    virtual void displayStatus(const std::string& status) = 0;

    // Emits a raw progress fragment without a trailing newline.
    // Called from the progress indicator thread while the main thread is
    // blocked on a request.
    virtual void displayProgress(const std::string& fragment) = 0;

    // True when input comes from a terminal rather than a pipe or file.
    virtual bool isInteractive() const = 0;

    // Virtual destructor to ensure proper cleanup of derived classes.
    virtual ~UserInterface() = default;
};

} // namespace ui
} // namespace edi
