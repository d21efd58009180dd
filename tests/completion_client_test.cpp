#include "gtest/gtest.h"
#include "test_doubles.h"
#include <edi/net/completion_client.h>
#include <nlohmann/json.hpp>
#include <algorithm>

using edi::core::Role;
using edi::core::Transcript;
using edi::core::Turn;
using edi::net::ChatCompletionClient;
using edi::net::CompletionResult;

class CompletionClientTest : public ::testing::Test {
protected:
    CompletionResult send() {
        return m_client.send(m_transcript, "GPT-5", "secret-key");
    }

    edi::test::FakeTransport m_transport;
    ChatCompletionClient m_client{m_transport, "https://api.poe.com"};
    Transcript m_transcript{Turn{Role::User, "Hello"}};
};

TEST_F(CompletionClientTest, SingleChoiceYieldsReply) {
    m_transport.respond(200, "OK", R"({"choices":[{"message":{"content":"hi"}}]})");
    CompletionResult result = send();
    EXPECT_EQ(result.status, CompletionResult::Status::Reply);
    EXPECT_EQ(result.text, "hi");
    EXPECT_FALSE(result.isFailure());
}

TEST_F(CompletionClientTest, ConcatenatesChoicesInOrder) {
    m_transport.respond(200, "OK", R"({
        "id": "chatcmpl-1",
        "object": "chat.completion",
        "choices": [
            {"index": 0, "message": {"role": "assistant", "content": "Hi "}, "finish_reason": "stop"},
            {"index": 1, "message": {"role": "assistant", "content": null}},
            {"index": 2, "message": {"role": "assistant", "content": "there"}}
        ],
        "usage": {"prompt_tokens": 3}
    })");
    CompletionResult result = send();
    EXPECT_EQ(result.status, CompletionResult::Status::Reply);
    EXPECT_EQ(result.text, "Hi there");
}

TEST_F(CompletionClientTest, EmptyChoicesIsDistinguished) {
    m_transport.respond(200, "OK", R"({"choices":[]})");
    CompletionResult result = send();
    EXPECT_EQ(result.status, CompletionResult::Status::EmptyChoices);
    EXPECT_FALSE(result.isFailure());
}

TEST_F(CompletionClientTest, MissingChoicesIsEmpty) {
    m_transport.respond(200, "OK", R"({"id":"x"})");
    EXPECT_EQ(send().status, CompletionResult::Status::EmptyChoices);
}

TEST_F(CompletionClientTest, UnauthorizedYieldsHttpError) {
    m_transport.respond(401, "Unauthorized", R"({"error":{"message":"bad key"}})");
    CompletionResult result = send();
    EXPECT_EQ(result.status, CompletionResult::Status::HttpError);
    EXPECT_EQ(result.http_status, 401);
    EXPECT_EQ(result.reason, "Unauthorized");
    EXPECT_EQ(result.describe(), "401 Unauthorized");
    EXPECT_TRUE(result.isFailure());
}

TEST_F(CompletionClientTest, ServerErrorYieldsHttpError) {
    m_transport.respond(500, "Internal Server Error", "oops");
    CompletionResult result = send();
    EXPECT_EQ(result.status, CompletionResult::Status::HttpError);
    EXPECT_EQ(result.describe(), "500 Internal Server Error");
}

TEST_F(CompletionClientTest, ConnectionDropYieldsTransportError) {
    m_transport.transport_error = "Recv failure: Connection reset by peer";
    CompletionResult result = send();
    EXPECT_EQ(result.status, CompletionResult::Status::TransportError);
    EXPECT_EQ(result.describe(), "Recv failure: Connection reset by peer");
    EXPECT_EQ(m_transport.calls, 1);
}

TEST_F(CompletionClientTest, NonJsonBodyYieldsDecodeError) {
    m_transport.respond(200, "OK", "<html>gateway</html>");
    CompletionResult result = send();
    EXPECT_EQ(result.status, CompletionResult::Status::DecodeError);
    EXPECT_FALSE(result.describe().empty());
}

TEST_F(CompletionClientTest, MalformedChoicesYieldDecodeError) {
    m_transport.respond(200, "OK", R"({"choices":{"message":"x"}})");
    EXPECT_EQ(send().status, CompletionResult::Status::DecodeError);

    m_transport.respond(200, "OK", R"({"choices":[{"text":"legacy"}]})");
    EXPECT_EQ(send().status, CompletionResult::Status::DecodeError);

    m_transport.respond(200, "OK", R"({"choices":[{"message":{"content":17}}]})");
    EXPECT_EQ(send().status, CompletionResult::Status::DecodeError);

    m_transport.respond(200, "OK", R"(["not", "an", "object"])");
    EXPECT_EQ(send().status, CompletionResult::Status::DecodeError);
}

TEST_F(CompletionClientTest, PostsTranscriptWithBearerAuth) {
    m_transcript.push_back(Turn{Role::Assistant, "Hi"});
    m_transcript.push_back(Turn{Role::User, "How are you?"});
    m_transport.respond(200, "OK", R"({"choices":[{"message":{"content":"fine"}}]})");

    send();

    EXPECT_EQ(m_transport.last_url, "https://api.poe.com/v1/chat/completions");
    const auto& headers = m_transport.last_headers;
    EXPECT_NE(std::find(headers.begin(), headers.end(), "Authorization: Bearer secret-key"), headers.end());
    EXPECT_NE(std::find(headers.begin(), headers.end(), "Content-Type: application/json"), headers.end());

    nlohmann::json body = nlohmann::json::parse(m_transport.last_body);
    EXPECT_EQ(body["model"].get<std::string>(), "GPT-5");
    EXPECT_FALSE(body["stream"].get<bool>());
    EXPECT_EQ(body["messages"], nlohmann::json::parse(R"([
        {"role":"user","content":"Hello"},
        {"role":"assistant","content":"Hi"},
        {"role":"user","content":"How are you?"}
    ])"));
}

TEST_F(CompletionClientTest, TrailingSlashInBaseUrlIsIgnored) {
    ChatCompletionClient client(m_transport, "http://localhost:8080/");
    EXPECT_EQ(client.endpointUrl(), "http://localhost:8080/v1/chat/completions");
}

TEST_F(CompletionClientTest, EmptyTranscriptIsRejected) {
    EXPECT_THROW(m_client.send(Transcript{}, "GPT-5", "secret-key"), std::invalid_argument);
    EXPECT_EQ(m_transport.calls, 0);
}

TEST(ReasonPhraseTest, KnownAndUnknownCodes) {
    EXPECT_EQ(edi::net::standardReasonPhrase(401), "Unauthorized");
    EXPECT_EQ(edi::net::standardReasonPhrase(429), "Too Many Requests");
    EXPECT_EQ(edi::net::standardReasonPhrase(599), "");
}

TEST(CompletionResultTest, HttpErrorWithoutReasonShowsCode) {
    EXPECT_EQ(CompletionResult::httpError(418, "").describe(), "418");
}
