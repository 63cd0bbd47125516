#include <gtest/gtest.h>
#include <string>

#include "agent/ContinueDecision.h"

TEST(ContinueLoop, StartsAwaitingDecision) {
    ContinueLoop loop;
    EXPECT_EQ(loop.getState(), ContinueState::AwaitingDecision);
}

TEST(ContinueLoop, DeclineEndsSession) {
    ContinueLoop loop;
    auto decision = loop.decide(nlohmann::json{{"continue", false}, {"instruction", "ignored"}});
    EXPECT_EQ(decision.state, ContinueState::End);
    EXPECT_FALSE(decision.shouldContinue);
    EXPECT_FALSE(decision.carriedInstruction.has_value());
    EXPECT_EQ(loop.getState(), ContinueState::End);
}

TEST(ContinueLoop, InstructionIsTrimmedAndCarried) {
    ContinueLoop loop;
    auto decision = loop.decide(nlohmann::json{{"continue", true}, {"instruction", "  add tests\n"}});
    EXPECT_EQ(decision.state, ContinueState::ContinueWithInstruction);
    EXPECT_TRUE(decision.shouldContinue);
    ASSERT_TRUE(decision.carriedInstruction.has_value());
    EXPECT_EQ(*decision.carriedInstruction, "add tests");
}

TEST(ContinueLoop, LegacyNewInstructionKeyIsAccepted) {
    ContinueLoop loop;
    auto decision = loop.decide(nlohmann::json{{"continue", true}, {"newInstruction", "refactor"}});
    ASSERT_TRUE(decision.carriedInstruction.has_value());
    EXPECT_EQ(*decision.carriedInstruction, "refactor");
}

TEST(ContinueLoop, WhitespaceInstructionMeansIdle) {
    ContinueLoop loop;
    auto decision = loop.decide(nlohmann::json{{"continue", true}, {"instruction", "   "}});
    EXPECT_EQ(decision.state, ContinueState::ContinueIdle);
    EXPECT_TRUE(decision.shouldContinue);
    EXPECT_FALSE(decision.carriedInstruction.has_value());
}

TEST(ContinueLoop, NonObjectOrMissingFlagMeansEnd) {
    ContinueLoop loop;
    EXPECT_EQ(loop.decide(nlohmann::json("yes")).state, ContinueState::End);
    EXPECT_EQ(loop.decide(nlohmann::json()).state, ContinueState::End);
    EXPECT_EQ(loop.decide(nlohmann::json{{"instruction", "x"}}).state, ContinueState::End);
    EXPECT_EQ(loop.decide(nlohmann::json{{"continue", "true"}}).state, ContinueState::End);
}

TEST(ContinueLoop, ImagesTravelWithTheDecision) {
    ContinueLoop loop;
    auto decision = loop.decide(nlohmann::json{
        {"continue", true},
        {"instruction", "match this layout"},
        {"images", {"data:image/png;base64,QUJD"}}
    });
    ASSERT_EQ(decision.attachments.size(), 1u);
    EXPECT_EQ(decision.attachments[0].mimeType, "image/png");
    EXPECT_EQ(decision.attachments[0].data, "QUJD");
}

TEST(ContinueLoop, DialogAnswerDrivesTransitions) {
    ContinueLoop loop;
    DialogAnswer cancelled;
    EXPECT_EQ(loop.decide(cancelled).state, ContinueState::End);

    loop.reset();
    EXPECT_EQ(loop.getState(), ContinueState::AwaitingDecision);

    DialogAnswer yes;
    yes.answered = true;
    yes.confirmed = true;
    EXPECT_EQ(loop.decide(yes).state, ContinueState::ContinueIdle);

    yes.text = "next";
    EXPECT_EQ(loop.decide(yes).state, ContinueState::ContinueWithInstruction);
}

TEST(ContinueText, EndDecisionFormat) {
    std::string text = formatContinueText(ContinueDecision::end());
    EXPECT_EQ(text.rfind("RESULT: should_continue=false\n", 0), 0u) << text;
    EXPECT_EQ(text.find("INSTRUCTION_BEGIN"), std::string::npos);
}

TEST(ContinueText, InstructionBlockFormat) {
    std::string text = formatContinueText(ContinueDecision::withInstruction("write docs"));
    EXPECT_EQ(text.rfind("RESULT: should_continue=true\n\nINSTRUCTION_BEGIN\nwrite docs\nINSTRUCTION_END\n\n", 0), 0u)
        << text;
    EXPECT_NE(text.find("ask_continue"), std::string::npos);
}

TEST(ContinueText, IdleHasNoInstructionBlock) {
    std::string text = formatContinueText(ContinueDecision::idle());
    EXPECT_EQ(text.rfind("RESULT: should_continue=true\n", 0), 0u);
    EXPECT_EQ(text.find("INSTRUCTION_BEGIN"), std::string::npos);
}

TEST(ContinueText, ParseRecoversEveryState) {
    auto end = parseContinueText(formatContinueText(ContinueDecision::end()));
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(end->state, ContinueState::End);

    auto idle = parseContinueText(formatContinueText(ContinueDecision::idle()));
    ASSERT_TRUE(idle.has_value());
    EXPECT_EQ(idle->state, ContinueState::ContinueIdle);

    std::string multiline = "line one\nline two\n\nINSTRUCTION_END inside";
    auto carried = parseContinueText(formatContinueText(ContinueDecision::withInstruction(multiline)));
    ASSERT_TRUE(carried.has_value());
    EXPECT_EQ(carried->state, ContinueState::ContinueWithInstruction);
    EXPECT_EQ(*carried->carriedInstruction, multiline);
}

TEST(ContinueText, ParseRejectsForeignText) {
    EXPECT_FALSE(parseContinueText("").has_value());
    EXPECT_FALSE(parseContinueText("should_continue=true").has_value());
    EXPECT_FALSE(parseContinueText("RESULT: should_continue=maybe\n").has_value());
    EXPECT_FALSE(parseContinueText("RESULT: should_continue=true\n\nINSTRUCTION_BEGIN\nno end").has_value());
}
