#pragma once

#include <edi/core/types.h>
#include <edi/net/http_transport.h>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace edi {
namespace net {

// Outcome of one exchange with the completion endpoint.
struct CompletionResult {
    enum class Status {
        Reply,          // text holds the assistant reply
        EmptyChoices,   // well-formed success without any choice
        HttpError,      // http_status / reason hold the rejection
        TransportError, // message holds the transport failure
        DecodeError,    // message describes the unexpected body
    };

    Status status = Status::EmptyChoices;
    std::string text;
    long http_status = 0;
    std::string reason;
    std::string message;

    bool isFailure() const {
        return status == Status::HttpError || status == Status::TransportError || status == Status::DecodeError;
    }

    // Human-readable description of a failure, e.g. "401 Unauthorized".
    std::string describe() const;

    static CompletionResult reply(std::string text);
    static CompletionResult emptyChoices();
    static CompletionResult httpError(long status, std::string reason);
    static CompletionResult transportError(std::string message);
    static CompletionResult decodeError(std::string message);
};

/**
 * Sends a transcript to a chat-completions endpoint and classifies the answer.
 * Implementations make exactly one attempt per call and never retry.
 */
class CompletionClient {
public:
    virtual ~CompletionClient() = default;

    virtual CompletionResult send(const core::Transcript& transcript,
                                  const std::string& model,
                                  const std::string& credential) = 0;
};

/**
 * CompletionClient for the OpenAI-style `/v1/chat/completions` contract:
 * - Builds the {model, messages, stream: false} request body
 * - Posts it through an HttpTransport with bearer authentication
 * - Concatenates every choice's message content into the reply
 */
class ChatCompletionClient : public CompletionClient {
public:
    // `transport` must outlive the client.
    ChatCompletionClient(HttpTransport& transport, std::string base_url);

    CompletionResult send(const core::Transcript& transcript,
                          const std::string& model,
                          const std::string& credential) override;

    const std::string& endpointUrl() const { return m_endpoint_url; }

    static nlohmann::json buildRequestBody(const core::Transcript& transcript, const std::string& model);

    // Classifies a 200 response body.
    static CompletionResult parseResponseBody(const std::string& body);

private:
    HttpTransport& m_transport;
    std::string m_endpoint_url;
};

} // namespace net
} // namespace edi
