#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "judge/comparative_judge.hpp"
#include "test/assertions.hpp"
#include "test/workspace.hpp"

using namespace std;
using namespace vibe;

class ComparativeJudgeTest : public ::testing::Test {
protected:
    static judge_config config() {
        judge_config config;
        config.model = "openai/gpt-4o";
        config.api_key_env = "VIBE_TEST_UNSET_KEY";
        return config;
    }

    comparative_judge judge{config()};
    code_files some_code = {{"main.py", "print('hi')"}};
    code_files no_code;
};

TEST_F(ComparativeJudgeTest, ParsesWinnerA) {
    auto result = parse_comparison_reply(
        "Verdict:\n```json\n{\"winner\": \"A\", \"confidence\": \"high\", \"reasoning\": \"A handles errors\"}\n```",
        "model-x", "model-y");
    EXPECT_EQ(result.winner, comparison_winner::A);
    EXPECT_EQ(result.confidence, comparison_confidence::HIGH);
    EXPECT_EQ(result.reasoning, "A handles errors");
    EXPECT_EQ(result.winner_name(), "model-x");
}

TEST_F(ComparativeJudgeTest, NormalizesCaseOfWinnerB) {
    auto result = parse_comparison_reply(R"({"winner": "b", "confidence": "LOW"})", "model-x", "model-y");
    EXPECT_EQ(result.winner, comparison_winner::B);
    EXPECT_EQ(result.confidence, comparison_confidence::LOW);
    EXPECT_EQ(result.reasoning, "No reasoning provided");
    EXPECT_EQ(result.winner_name(), "model-y");
}

TEST_F(ComparativeJudgeTest, UnknownValuesBecomeTie) {
    auto tie = parse_comparison_reply(R"({"winner": "TIE", "confidence": "medium", "reasoning": "Equal"})", "x", "y");
    EXPECT_EQ(tie.winner, comparison_winner::TIE);
    EXPECT_EQ(tie.winner_name(), "TIE");

    auto unknown = parse_comparison_reply(R"({"winner": "both", "confidence": "certain"})", "x", "y");
    EXPECT_EQ(unknown.winner, comparison_winner::TIE);
    EXPECT_EQ(unknown.confidence, comparison_confidence::MEDIUM);
}

TEST_F(ComparativeJudgeTest, MalformedReplyIsLowConfidenceTie) {
    auto garbled = parse_comparison_reply("I prefer the first one.", "x", "y");
    EXPECT_EQ(garbled.winner, comparison_winner::TIE);
    EXPECT_EQ(garbled.confidence, comparison_confidence::LOW);
    EXPECT_EQ(garbled.reasoning.rfind("Judge parsing error: ", 0), 0u);

    auto missing = parse_comparison_reply(R"({"confidence": "high"})", "x", "y");
    EXPECT_EQ(missing.winner, comparison_winner::TIE);
    EXPECT_EQ(missing.confidence, comparison_confidence::LOW);
}

TEST_F(ComparativeJudgeTest, MissingCodeDecidesWithoutRequest) {
    auto neither = judge.compare("spec", no_code, no_code, "x", "y");
    EXPECT_EQ(neither.winner, comparison_winner::TIE);
    EXPECT_EQ(neither.confidence, comparison_confidence::HIGH);
    EXPECT_EQ(neither.reasoning, "Neither model produced any code");

    auto only_b = judge.compare("spec", no_code, some_code, "x", "y");
    EXPECT_EQ(only_b.winner, comparison_winner::B);
    EXPECT_EQ(only_b.reasoning, "Model A produced no code");

    auto only_a = judge.compare("spec", some_code, no_code, "x", "y");
    EXPECT_EQ(only_a.winner, comparison_winner::A);
    EXPECT_FALSE(only_a.metrics);
}

TEST_F(ComparativeJudgeTest, ComparesAllPairsInOrder) {
    temp_workspace empty_a, empty_b, empty_c;
    auto results = run_all_comparisons("spec", {{"a", empty_a.path()}, {"b", empty_b.path()}, {"c", empty_c.path()}}, judge);
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].model_a, "a");
    EXPECT_EQ(results[0].model_b, "b");
    EXPECT_EQ(results[1].model_b, "c");
    EXPECT_EQ(results[2].model_a, "b");
    EXPECT_EQ(results[2].winner, comparison_winner::TIE);
}

TEST_F(ComparativeJudgeTest, PromptContainsBothImplementations) {
    string prompt = build_comparison_prompt("Build a calculator", {{"a.py", "print(1)"}}, {{"b.html", "<html></html>"}});
    EXPECT_NE(prompt.find("## Implementation A:\n### a.py"), string::npos);
    EXPECT_NE(prompt.find("## Implementation B:\n### b.html"), string::npos);
    EXPECT_NE(prompt.find("\"winner\": \"A\" or \"B\" or \"TIE\""), string::npos);
}

TEST_F(ComparativeJudgeTest, SerializesResult) {
    auto result = parse_comparison_reply(R"({"winner": "A", "confidence": "high", "reasoning": "Complete"})", "x", "y");
    result.metrics = judge_metrics{10, 5, "openai/gpt-4o"};
    nlohmann::json j = result;
    EXPECT_EQ(j["winner_name"], "x");
    EXPECT_EQ(j["confidence"], "high");
    ASSERT_JSON_EQ(nlohmann::json(j.get<comparison_result>()), j);
}

TEST_F(ComparativeJudgeTest, RequestWithoutKeyFails) {
    EXPECT_THROW(judge.compare("spec", some_code, some_code, "x", "y"), network_error);
}
