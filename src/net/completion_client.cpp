#include <edi/net/completion_client.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

namespace edi {
namespace net {

namespace {
constexpr const char* kCompletionsPath = "/v1/chat/completions";
} // namespace

std::string CompletionResult::describe() const {
    switch (status) {
    case Status::HttpError:
        return reason.empty() ? std::to_string(http_status) : std::to_string(http_status) + " " + reason;
    case Status::TransportError:
    case Status::DecodeError:
        return message;
    case Status::EmptyChoices:
        return "No response received.";
    case Status::Reply:
        return text;
    }
    return message;
}

CompletionResult CompletionResult::reply(std::string text) {
    CompletionResult result;
    result.status = Status::Reply;
    result.text = std::move(text);
    return result;
}

CompletionResult CompletionResult::emptyChoices() {
    CompletionResult result;
    result.status = Status::EmptyChoices;
    return result;
}

CompletionResult CompletionResult::httpError(long status, std::string reason) {
    CompletionResult result;
    result.status = Status::HttpError;
    result.http_status = status;
    result.reason = std::move(reason);
    return result;
}

CompletionResult CompletionResult::transportError(std::string message) {
    CompletionResult result;
    result.status = Status::TransportError;
    result.message = std::move(message);
    return result;
}

CompletionResult CompletionResult::decodeError(std::string message) {
    CompletionResult result;
    result.status = Status::DecodeError;
    result.message = std::move(message);
    return result;
}

ChatCompletionClient::ChatCompletionClient(HttpTransport& transport, std::string base_url)
    : m_transport(transport) {
    while (!base_url.empty() && base_url.back() == '/') {
        base_url.pop_back();
    }
    m_endpoint_url = base_url + kCompletionsPath;
}

nlohmann::json ChatCompletionClient::buildRequestBody(const core::Transcript& transcript, const std::string& model) {
    nlohmann::json payload;
    payload["model"] = model;
    payload["messages"] = transcript;
    payload["stream"] = false;
    return payload;
}

CompletionResult ChatCompletionClient::parseResponseBody(const std::string& body) {
    nlohmann::json response;
    try {
        response = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return CompletionResult::decodeError("Error parsing API response: " + std::string(e.what()));
    }

    if (!response.is_object()) {
        return CompletionResult::decodeError("Invalid API response structure: expected a JSON object");
    }
    if (!response.contains("choices") || response["choices"].is_null()) {
        return CompletionResult::emptyChoices();
    }
    const auto& choices = response["choices"];
    if (!choices.is_array()) {
        return CompletionResult::decodeError("Invalid API response structure: 'choices' is not an array");
    }
    if (choices.empty()) {
        return CompletionResult::emptyChoices();
    }

    std::string reply;
    for (const auto& choice : choices) {
        if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object()) {
            return CompletionResult::decodeError("Invalid API response structure: choice without a message. Response was: " + response.dump());
        }
        const auto& message = choice["message"];
        if (!message.contains("content") || message["content"].is_null()) {
            continue;
        }
        if (!message["content"].is_string()) {
            return CompletionResult::decodeError("Invalid API response structure: message content is not a string");
        }
        reply += message["content"].get<std::string>();
    }
    return CompletionResult::reply(std::move(reply));
}

CompletionResult ChatCompletionClient::send(const core::Transcript& transcript,
                                            const std::string& model,
                                            const std::string& credential) {
    if (transcript.empty()) {
        throw std::invalid_argument("Cannot send an empty transcript");
    }

    const std::vector<std::string> headers = {
        "Authorization: Bearer " + credential,
        "Content-Type: application/json",
    };
    // Invalid UTF-8 in user input is sent as U+FFFD rather than failing the exchange.
    const std::string payload = buildRequestBody(transcript, model)
                                    .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    HttpResponse response;
    try {
        response = m_transport.post(m_endpoint_url, headers, payload);
    } catch (const TransportError& e) {
        return CompletionResult::transportError(e.what());
    }

    if (response.status != 200) {
        return CompletionResult::httpError(response.status, response.reason);
    }
    return parseResponseBody(response.body);
}

} // namespace net
} // namespace edi
