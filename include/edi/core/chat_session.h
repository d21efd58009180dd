#pragma once

#include <edi/core/session_store.h>
#include <edi/core/types.h>
#include <edi/net/completion_client.h>
#include <edi/ui/ui_interface.h>
#include <chrono>
#include <string>

namespace edi {
namespace core {

struct ChatOptions {
    // Start from the saved session without asking.
    bool resume = false;
    // Input is a terminal: prompt repeatedly and show the progress indicator.
    // Otherwise the piped input is sent once and the session ends.
    bool interactive = true;
    // When interactive and not resuming, ask whether to continue the last session.
    bool offer_resume = true;
    std::chrono::milliseconds progress_tick{500};
};

/**
 * ChatSession runs the conversation loop:
 * - Collects a user turn from the UserInterface
 * - Sends the transcript through the CompletionClient while a
 *   ProgressIndicator runs (interactive mode only)
 * - Renders the outcome and saves the transcript after every reply
 */
class ChatSession {
public:
    // All references must outlive the session.
    ChatSession(ui::UserInterface& ui_ref,
                net::CompletionClient& client_ref,
                SessionStore& store_ref,
                std::string model,
                std::string credential,
                ChatOptions options);

    // Runs until the user ends input (interactive) or after one exchange
    // (non-interactive). Returns the number of requests that were sent.
    int run();

    const Transcript& transcript() const { return m_transcript; }

private:
    enum class State {
        AwaitingInput,
        Sending,
        Rendering,
        Terminated,
    };

    void loadInitialTranscript();
    State awaitInput();
    net::CompletionResult sendTranscript();
    State render(const net::CompletionResult& result);

    ui::UserInterface& m_ui;
    net::CompletionClient& m_client;
    SessionStore& m_store;
    std::string m_model;
    std::string m_credential;
    ChatOptions m_options;
    Transcript m_transcript;
};

} // namespace core
} // namespace edi
