#include <memory>
#include "gtest/gtest.h"
#include "judge/multi_judge.hpp"
#include "test/fake_judge.hpp"

using namespace std;
using namespace vibe;

class MultiJudgeTest : public ::testing::Test {
protected:
    static vector<pair<string, absolute_score>> spread_scores() {
        return {{"judge_a", fake_judge::uniform(7)},
                {"judge_b", fake_judge::uniform(8)},
                {"judge_c", fake_judge::uniform(9)}};
    }

    static pair<shared_ptr<const judge_client>, double> judge(const string &name, int score,
                                                              fake_judge::behavior kind = fake_judge::NORMAL,
                                                              double timeout = 5) {
        return {make_shared<fake_judge>(name, score, kind, chrono::milliseconds(2000)), timeout};
    }

    code_files files = {{"main.py", "print('hi')"}};
};

TEST_F(MultiJudgeTest, MedianOfThree) {
    auto result = aggregate_scores(spread_scores(), aggregation_mode::MEDIAN, 15);
    EXPECT_DOUBLE_EQ(result.final_score, 80);
    EXPECT_DOUBLE_EQ(result.spread, 20);
    EXPECT_TRUE(result.disagreement_flag);
    EXPECT_EQ(result.judges_used, (vector<string>{"judge_a", "judge_b", "judge_c"}));
    EXPECT_DOUBLE_EQ(result.aggregated_dimensions.at("executes"), 8);
    EXPECT_DOUBLE_EQ(result.dimension_spreads.at("code_quality"), 2);
}

TEST_F(MultiJudgeTest, AverageMatchesMedianForSymmetricScores) {
    auto result = aggregate_scores(spread_scores(), aggregation_mode::AVERAGE, 25);
    EXPECT_DOUBLE_EQ(result.final_score, 80);
    EXPECT_FALSE(result.disagreement_flag);
}

TEST_F(MultiJudgeTest, MedianResistsOutlier) {
    vector<pair<string, absolute_score>> scores = {
        {"a", fake_judge::uniform(8)}, {"b", fake_judge::uniform(8)}, {"c", fake_judge::uniform(1)}};
    EXPECT_DOUBLE_EQ(aggregate_scores(scores, aggregation_mode::MEDIAN, 15).final_score, 80);
    EXPECT_DOUBLE_EQ(aggregate_scores(scores, aggregation_mode::AVERAGE, 15).final_score, 56.7);
    EXPECT_DOUBLE_EQ(aggregate_scores(scores, aggregation_mode::CONSENSUS, 15).final_score, 80);
}

TEST_F(MultiJudgeTest, MedianOfEvenCountAveragesMiddle) {
    vector<pair<string, absolute_score>> scores = {{"a", fake_judge::uniform(6)}, {"b", fake_judge::uniform(9)}};
    auto result = aggregate_scores(scores, aggregation_mode::MEDIAN, 15);
    EXPECT_DOUBLE_EQ(result.final_score, 75);
    EXPECT_DOUBLE_EQ(result.aggregated_dimensions.at("features_complete"), 7.5);
    EXPECT_EQ(result.as_absolute_score().features_complete.score, 8);
}

TEST_F(MultiJudgeTest, SingleJudgeHasNoSpread) {
    auto result = aggregate_scores({{"solo", fake_judge::uniform(6)}}, aggregation_mode::MEDIAN, 15);
    EXPECT_DOUBLE_EQ(result.final_score, 60);
    EXPECT_DOUBLE_EQ(result.spread, 0);
    EXPECT_FALSE(result.disagreement_flag);
}

TEST_F(MultiJudgeTest, NoJudgesFlagsDisagreement) {
    auto result = aggregate_scores({}, aggregation_mode::MEDIAN, 15);
    EXPECT_DOUBLE_EQ(result.final_score, 0);
    EXPECT_TRUE(result.disagreement_flag);
    EXPECT_TRUE(result.judges_used.empty());
    EXPECT_DOUBLE_EQ(result.as_absolute_score().total_score(), 0);
}

TEST_F(MultiJudgeTest, IsDeterministic) {
    auto first = aggregate_scores(spread_scores(), aggregation_mode::MEDIAN, 15);
    auto second = aggregate_scores(spread_scores(), aggregation_mode::MEDIAN, 15);
    EXPECT_EQ(nlohmann::json(first), nlohmann::json(second));
}

TEST_F(MultiJudgeTest, ConvertsToAbsoluteScore) {
    auto result = aggregate_scores(spread_scores(), aggregation_mode::MEDIAN, 15);
    auto score = result.as_absolute_score();
    EXPECT_EQ(score.executes.score, 8);
    EXPECT_EQ(score.executes.reason, "Aggregated from 3 judges (median)");
    EXPECT_DOUBLE_EQ(score.total_score(), 80);
}

TEST_F(MultiJudgeTest, SumsJudgeUsage) {
    auto result = aggregate_scores(spread_scores(), aggregation_mode::MEDIAN, 15);
    EXPECT_EQ(result.total_judge_tokens(), 450);
    nlohmann::json j = result;
    EXPECT_EQ(j.at("aggregation_mode"), "median");
    EXPECT_EQ(j.at("total_judge_tokens"), 450);

    auto parsed = j.get<multi_judge_score>();
    EXPECT_EQ(parsed.individual_scores.size(), 3u);
    EXPECT_DOUBLE_EQ(parsed.final_score, 80);
    EXPECT_TRUE(parsed.disagreement_flag);
}

TEST_F(MultiJudgeTest, ParsesModes) {
    EXPECT_EQ(parse_aggregation_mode("average"), aggregation_mode::AVERAGE);
    EXPECT_EQ(parse_aggregation_mode("consensus"), aggregation_mode::CONSENSUS);
    EXPECT_STREQ(get_display_message(aggregation_mode::MEDIAN), "median");
    EXPECT_THROW(parse_aggregation_mode("mode"), invalid_argument);
}

TEST_F(MultiJudgeTest, ArbitratorRunsAllJudges) {
    multi_judge_arbitrator arbitrator({judge("a", 7), judge("b", 8), judge("c", 9)});
    EXPECT_EQ(arbitrator.size(), 3u);
    auto result = arbitrator.score("Build a calculator", files);
    EXPECT_DOUBLE_EQ(result.final_score, 80);
    EXPECT_EQ(result.judges_used, (vector<string>{"a", "b", "c"}));
}

TEST_F(MultiJudgeTest, FailingJudgeScoresZero) {
    multi_judge_arbitrator arbitrator({judge("a", 8), judge("broken", 8, fake_judge::THROW)});
    auto result = arbitrator.score("spec", files);
    ASSERT_EQ(result.individual_scores.size(), 2u);
    auto &failed = result.individual_scores.at("broken");
    EXPECT_DOUBLE_EQ(failed.total_score(), 0);
    EXPECT_EQ(failed.executes.reason, "Judge failed: upstream unavailable");
    EXPECT_DOUBLE_EQ(result.final_score, 40);
    EXPECT_DOUBLE_EQ(result.spread, 80);
    EXPECT_TRUE(result.disagreement_flag);
    EXPECT_EQ(result.total_judge_tokens(), 150);
}

TEST_F(MultiJudgeTest, SlowJudgeTimesOut) {
    multi_judge_arbitrator arbitrator({judge("fast", 9), judge("slow", 9, fake_judge::SLOW, 0.2)});
    auto start = chrono::steady_clock::now();
    auto result = arbitrator.score("spec", files);
    EXPECT_LT(chrono::steady_clock::now() - start, chrono::milliseconds(1500));
    auto &slow = result.individual_scores.at("slow");
    EXPECT_EQ(slow.executes.reason, "Judge timed out after 0.2s");
    EXPECT_EQ(slow.code_quality.reason, "Judge failed");
    EXPECT_DOUBLE_EQ(result.individual_scores.at("fast").total_score(), 90);
}

TEST_F(MultiJudgeTest, DestructionWaitsForTimedOutJudges) {
    auto slow = make_shared<fake_judge>("slow", 9, fake_judge::SLOW, chrono::milliseconds(500));
    {
        vector<pair<shared_ptr<const judge_client>, double>> judges = {{slow, 0.1}};
        multi_judge_arbitrator arbitrator(judges);
        auto result = arbitrator.score("spec", files);
        EXPECT_EQ(result.individual_scores.at("slow").executes.reason, "Judge timed out after 0.1s");
        EXPECT_EQ(slow->finished_calls(), 0);
    }
    EXPECT_EQ(slow->finished_calls(), 1);
}

TEST_F(MultiJudgeTest, ReusedArbitratorCollectsFinishedJudges) {
    multi_judge_arbitrator arbitrator({judge("a", 7), judge("b", 9)});
    for (int i = 0; i < 3; ++i)
        EXPECT_DOUBLE_EQ(arbitrator.score("spec", files).final_score, 80);
}

TEST_F(MultiJudgeTest, ReadsArbitrationConfig) {
    auto config = nlohmann::json::parse(R"({
        "mode": "average",
        "threshold": 10,
        "judges": ["openai/gpt-4o", {"model": "anthropic/claude-sonnet-4", "timeout": 30}]
    })").get<arbitration_config>();
    EXPECT_EQ(config.mode, aggregation_mode::AVERAGE);
    EXPECT_DOUBLE_EQ(config.threshold, 10);
    ASSERT_EQ(config.judges.size(), 2u);
    EXPECT_EQ(config.judges[0].id, "openai/gpt-4o");
    EXPECT_EQ(config.judges[1].id, "anthropic/claude-sonnet-4");
    EXPECT_DOUBLE_EQ(config.judges[1].timeout, 30);

    multi_judge_arbitrator arbitrator(config);
    EXPECT_EQ(arbitrator.size(), 2u);
    EXPECT_EQ(arbitrator.mode(), aggregation_mode::AVERAGE);
    EXPECT_EQ(default_judges().size(), 3u);
}
