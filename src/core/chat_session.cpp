#include <edi/core/chat_session.h>
#include <edi/core/progress_indicator.h>
#include <edi/core/transcript_builder.h>
#include <edi/utils/text_utils.h>
#include <optional>
#include <stdexcept>
#include <utility>

namespace edi {
namespace core {

namespace {
constexpr const char* kInputPrompt = ">>> \n";
constexpr const char* kOutputPrompt = "\n<<< \n";
constexpr const char* kResumeQuestion = "Continue last session? (y/n): ";
} // namespace

ChatSession::ChatSession(ui::UserInterface& ui_ref,
                         net::CompletionClient& client_ref,
                         SessionStore& store_ref,
                         std::string model,
                         std::string credential,
                         ChatOptions options)
    : m_ui(ui_ref), m_client(client_ref), m_store(store_ref),
      m_model(std::move(model)), m_credential(std::move(credential)), m_options(options) {}

// A new session simply never reads the record; the first saved reply
// overwrites whatever was there.
void ChatSession::loadInitialTranscript() {
    bool resume = m_options.resume;
    if (!resume && m_options.interactive && m_options.offer_resume) {
        resume = m_ui.confirm(kResumeQuestion);
    }
    if (resume) {
        m_transcript = m_store.load();
        m_ui.displayStatus("Resumed session with " + std::to_string(m_transcript.size()) + " messages from " + m_store.path().string());
    }
}

ChatSession::State ChatSession::awaitInput() {
    if (!m_options.interactive) {
        std::string message = m_ui.readPipedInput();
        if (message.empty()) {
            m_ui.displayStatus("No input received on stdin.");
            return State::Terminated;
        }
        m_ui.displayOutput(kInputPrompt + message);
        m_transcript = withUserTurn(m_transcript, std::move(message));
        return State::Sending;
    }

    auto input_opt = m_ui.promptUserInput();
    if (!input_opt || utils::trim(*input_opt).empty()) {
        return State::Terminated;
    }
    m_transcript = withUserTurn(m_transcript, std::move(*input_opt));
    return State::Sending;
}

// The indicator is scoped to this call and always joined before returning,
// so nothing it prints can interleave with the rendered result.
net::CompletionResult ChatSession::sendTranscript() {
    std::optional<ProgressIndicator> progress;
    if (m_options.interactive) {
        progress.emplace([this](const std::string& fragment) { m_ui.displayProgress(fragment); },
                         m_options.progress_tick);
    }

    // On an exception the indicator's destructor stops and joins it.
    net::CompletionResult result = m_client.send(m_transcript, m_model, m_credential);
    if (progress) {
        progress->stop();
    }
    return result;
}

ChatSession::State ChatSession::render(const net::CompletionResult& result) {
    switch (result.status) {
    case net::CompletionResult::Status::Reply:
        m_ui.displayOutput(kOutputPrompt + result.text);
        m_transcript.push_back(Turn{Role::Assistant, result.text});
        try {
            m_store.save(m_transcript);
            m_ui.displayStatus("Session saved to " + m_store.path().string());
        } catch (const std::runtime_error& e) {
            m_ui.displayError("Failed to save session: " + std::string(e.what()));
        }
        break;
    case net::CompletionResult::Status::EmptyChoices:
        m_ui.displayOutput("\n<<< No response received.");
        break;
    case net::CompletionResult::Status::HttpError:
    case net::CompletionResult::Status::TransportError:
    case net::CompletionResult::Status::DecodeError:
        // The user turn stays in memory; the next exchange resends it.
        // displayError adds the "Error: " prefix and writes to stderr.
        m_ui.displayError(result.describe());
        break;
    }
    return m_options.interactive ? State::AwaitingInput : State::Terminated;
}

int ChatSession::run() {
    loadInitialTranscript();

    int requests_sent = 0;
    State state = State::AwaitingInput;
    net::CompletionResult result;
    while (state != State::Terminated) {
        switch (state) {
        case State::AwaitingInput:
            state = awaitInput();
            break;
        case State::Sending:
            result = sendTranscript();
            ++requests_sent;
            state = State::Rendering;
            break;
        case State::Rendering:
            state = render(result);
            break;
        case State::Terminated:
            break;
        }
    }
    m_ui.displayStatus("Chat ended after " + std::to_string(requests_sent) + " request(s).");
    return requests_sent;
}

} // namespace core
} // namespace edi
