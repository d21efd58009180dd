#include "gtest/gtest.h"
#include <edi/core/transcript_builder.h>
#include <nlohmann/json.hpp>

using edi::core::Role;
using edi::core::Transcript;
using edi::core::Turn;

TEST(TranscriptBuilderTest, AppendsUserTurnToEmptyTranscript) {
    Transcript prior;
    Transcript next = edi::core::withUserTurn(prior, "Hello");

    ASSERT_EQ(next.size(), 1u);
    EXPECT_EQ(next[0].role, Role::User);
    EXPECT_EQ(next[0].content, "Hello");
    EXPECT_TRUE(prior.empty());
}

TEST(TranscriptBuilderTest, LeavesPriorTranscriptUntouched) {
    const Transcript prior = {
        Turn{Role::User, "first"},
        Turn{Role::Assistant, "reply"},
    };
    Transcript copy = prior;

    Transcript next = edi::core::withUserTurn(prior, "second\nwith two lines");

    EXPECT_EQ(prior, copy);
    ASSERT_EQ(next.size(), 3u);
    EXPECT_EQ(next[0], prior[0]);
    EXPECT_EQ(next[1], prior[1]);
    EXPECT_EQ(next[2], (Turn{Role::User, "second\nwith two lines"}));
}

TEST(TurnJsonTest, UsesLowercaseRoleNames) {
    nlohmann::json j = Transcript{Turn{Role::User, "q"}, Turn{Role::Assistant, "a"}};
    EXPECT_EQ(j.dump(), R"([{"content":"q","role":"user"},{"content":"a","role":"assistant"}])");
}

TEST(TurnJsonTest, RejectsUnknownRole) {
    nlohmann::json j = {{"role", "system"}, {"content", "x"}};
    EXPECT_THROW(j.get<Turn>(), std::invalid_argument);
}
