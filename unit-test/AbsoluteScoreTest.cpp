#include "gtest/gtest.h"
#include "scoring/absolute_score.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace vibe;

class AbsoluteScoreTest : public ::testing::Test {
protected:
    static absolute_score make(int executes, int features, int output, int direction, int quality) {
        absolute_score score;
        score.executes = {executes, ""};
        score.features_complete = {features, ""};
        score.output_quality = {output, ""};
        score.direction_following = {direction, ""};
        score.code_quality = {quality, ""};
        return score;
    }
};

TEST_F(AbsoluteScoreTest, WeightsSumToHundred) {
    int sum = 0;
    for (auto &[name, weight] : absolute_score::weights()) sum += weight;
    EXPECT_EQ(sum, 100);
    EXPECT_EQ(absolute_score::dimension_names().front(), "executes");
}

TEST_F(AbsoluteScoreTest, ComputesWeightedTotal) {
    EXPECT_DOUBLE_EQ(make(10, 10, 10, 10, 10).total_score(), 100);
    EXPECT_DOUBLE_EQ(make(5, 5, 5, 5, 5).total_score(), 50);
    EXPECT_DOUBLE_EQ(make(10, 8, 7, 9, 7).total_score(), 82.5);
    EXPECT_DOUBLE_EQ(make(0, 0, 0, 0, 0).total_score(), 0);
}

TEST_F(AbsoluteScoreTest, CapsScoreWhenExecutionFails) {
    auto score = make(2, 10, 10, 10, 10);
    EXPECT_TRUE(score.execution_gated());
    EXPECT_DOUBLE_EQ(score.total_score(), 30);

    auto low = make(1, 1, 1, 1, 1);
    EXPECT_TRUE(low.execution_gated());
    EXPECT_DOUBLE_EQ(low.total_score(), 10);

    auto edge = make(3, 10, 10, 10, 10);
    EXPECT_FALSE(edge.execution_gated());
    EXPECT_DOUBLE_EQ(edge.total_score(), 82.5);
}

TEST_F(AbsoluteScoreTest, AccessesDimensionsByName) {
    auto score = make(1, 2, 3, 4, 5);
    EXPECT_EQ(score.dimension("output_quality").score, 3);
    score.dimension("code_quality").score = 9;
    EXPECT_EQ(score.code_quality.score, 9);
    EXPECT_THROW(score.dimension("efficiency"), invalid_argument);
}

TEST_F(AbsoluteScoreTest, ZeroScoreCarriesReasons) {
    auto score = absolute_score::zero("Judge timed out", "Judge failed");
    EXPECT_DOUBLE_EQ(score.total_score(), 0);
    EXPECT_EQ(score.executes.reason, "Judge timed out");
    EXPECT_EQ(score.code_quality.reason, "Judge failed");
    EXPECT_FALSE(score.metrics);
}

TEST_F(AbsoluteScoreTest, EstimatesJudgeCost) {
    judge_metrics metrics{1000, 500, "anthropic/claude-opus-4.5"};
    EXPECT_EQ(metrics.total_tokens(), 1500);
    EXPECT_DOUBLE_EQ(metrics.estimated_cost(), 0.0175);

    judge_metrics unknown{1000000, 0, "someone/unknown-model"};
    EXPECT_DOUBLE_EQ(unknown.estimated_cost(), 3.0);
}

TEST_F(AbsoluteScoreTest, SerializesDimensions) {
    auto score = make(8, 7, 6, 5, 4);
    score.executes.reason = "Runs";
    score.metrics = judge_metrics{10, 20, "openai/gpt-4o"};

    nlohmann::json j = score;
    EXPECT_JSON_EQ(j.at("executes"), (nlohmann::json{{"score", 8}, {"reason", "Runs"}}));
    EXPECT_DOUBLE_EQ(j.at("total_score").get<double>(), 64);
    EXPECT_EQ(j.at("execution_gated"), false);
    EXPECT_EQ(j.at("judge_metrics").at("total_tokens"), 30);

    auto parsed = j.get<absolute_score>();
    EXPECT_EQ(parsed.code_quality.score, 4);
    ASSERT_TRUE(parsed.metrics);
    EXPECT_EQ(parsed.metrics->judge_model, "openai/gpt-4o");
}
