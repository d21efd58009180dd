#include "gtest/gtest.h"
#include <edi/app/config_store.h>
#include <edi/app/setup_prompts.h>
#include <sstream>
#include <stdexcept>

TEST(SetupPromptsTest, ApiKeyOfExpectedLengthIsAccepted) {
    const std::string key(edi::app::kApiKeyLength, 'a');
    std::istringstream in(key + "\n");
    std::ostringstream out;

    EXPECT_EQ(edi::app::promptApiKey(in, out), key);
    EXPECT_NE(out.str().find("Enter your Poe API key."), std::string::npos);
    EXPECT_EQ(out.str().find("Invalid API key length"), std::string::npos);
}

TEST(SetupPromptsTest, WrongLengthKeyIsRejectedUntilValid) {
    const std::string key(edi::app::kApiKeyLength, 'b');
    std::istringstream in("too-short\n" + key + "x\n" + key + "\n");
    std::ostringstream out;

    EXPECT_EQ(edi::app::promptApiKey(in, out), key);

    const std::string text = out.str();
    size_t complaints = 0;
    for (size_t pos = text.find("Invalid API key length. Expected 43 characters."); pos != std::string::npos;
         pos = text.find("Invalid API key length", pos + 1)) {
        ++complaints;
    }
    EXPECT_EQ(complaints, 2u);
}

TEST(SetupPromptsTest, ApiKeyPromptThrowsOnEndOfInput) {
    std::istringstream in("short\n");
    std::ostringstream out;
    EXPECT_THROW(edi::app::promptApiKey(in, out), std::runtime_error);
}

TEST(SetupPromptsTest, ModelIsChosenByNumber) {
    std::istringstream in("5\n");
    std::ostringstream out;

    EXPECT_EQ(edi::app::promptModel(in, out), "GPT-5");
    EXPECT_NE(out.str().find("1: Assistant\n"), std::string::npos);
    EXPECT_NE(out.str().find("9: Grok-4\n"), std::string::npos);
}

TEST(SetupPromptsTest, InvalidModelChoiceFallsBackToDefault) {
    for (const char* answer : {"0\n", "10\n", "abc\n", "2x\n", "", "99999999999999999999\n"}) {
        std::istringstream in(answer);
        std::ostringstream out;
        EXPECT_EQ(edi::app::promptModel(in, out), "Assistant") << "answer: " << answer;
        EXPECT_NE(out.str().find("Invalid choice, defaulting to Assistant."), std::string::npos);
    }
}
