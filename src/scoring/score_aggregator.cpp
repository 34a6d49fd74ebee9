#include "scoring/score_aggregator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_map>
#include "common/json_utils.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "judge/judge_client.hpp"

namespace vibe {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

// clang-format off
static const unordered_map<score_source, const char *> score_source_string = boost::assign::map_list_of
    (score_source::AUTO, "auto")
    (score_source::STATIC, "static")
    (score_source::JUDGE, "judge")
    (score_source::COMBINED, "combined")
    (score_source::METRICS, "metrics");
// clang-format on

const char *get_display_message(score_source source) {
    return score_source_string.at(source);
}

score_source parse_score_source(const string &source) {
    for (auto &[key, value] : score_source_string)
        if (source == value) return key;
    throw invalid_argument("unknown score source " + source);
}

double dimension_result::weighted_contribution() const {
    return score / 10.0 * weight * 100;
}

const vector<pair<string, double>> &final_score::weights() {
    static const vector<pair<string, double>> table = {
        {"executes", 0.15},
        {"test_pass_rate", 0.20},
        {"features_complete", 0.20},
        {"edge_cases", 0.10},
        {"code_quality", 0.10},
        {"efficiency", 0.05},
        {"direction_following", 0.10},
        {"robustness", 0.10}};
    return table;
}

double final_score::total_score() const {
    double total = 0;
    for (auto &[name, dimension] : dimensions)
        total += dimension.weighted_contribution();
    if (execution_gated)
        total = min(total, EXECUTION_GATE_CAP);
    return round_to(total, 1);
}

void to_json(json &j, const dimension_result &result) {
    j = {{"score", result.score},
         {"weight", result.weight},
         {"weighted_contribution", round_to(result.weighted_contribution(), 1)},
         {"source", get_display_message(result.source)},
         {"reason", result.reason}};
}

void from_json(const json &j, dimension_result &result) {
    result.score = get_value<int>(j, "score");
    result.weight = get_value<double>(j, "weight");
    result.source = parse_score_source(get_value<string>(j, "source"));
    result.reason = get_value_def<string>(j, "", "reason");
}

void to_json(json &j, const final_score &score) {
    j = {{"total_score", score.total_score()},
         {"execution_gated", score.execution_gated},
         {"dimensions", score.dimensions},
         {"auto_score", score.automatic ? json(*score.automatic) : json()},
         {"static_report", score.analysis ? json(*score.analysis) : json()}};
    if (score.judging) j["multi_judge"] = *score.judging;
}

void from_json(const json &j, final_score &score) {
    score.dimensions = get_value<map<string, dimension_result>>(j, "dimensions");
    score.execution_gated = get_value<bool>(j, "execution_gated");
    score.automatic.reset();
    score.analysis.reset();
    score.judging.reset();
    if (exists(j, "auto_score")) score.automatic = get_value<auto_score>(j, "auto_score");
    if (exists(j, "static_report")) score.analysis = get_value<static_report>(j, "static_report");
    if (exists(j, "multi_judge")) score.judging = get_value<multi_judge_score>(j, "multi_judge");
}

static int efficiency_score(const agent_metrics &metrics) {
    int score;
    if (metrics.turns == 1)
        score = 10;
    else if (metrics.turns <= 3)
        score = 8;
    else if (metrics.turns <= 5)
        score = 6;
    else
        score = max(3, 10 - metrics.turns);
    return max(0, score - metrics.backtrack_count);
}

final_score aggregate(const optional<auto_score> &automatic,
                      const optional<static_report> &analysis,
                      const optional<absolute_score> &judge,
                      const optional<agent_metrics> &metrics) {
    final_score result;
    result.automatic = automatic;
    result.analysis = analysis;

    unordered_map<string, double> weight(final_score::weights().begin(), final_score::weights().end());
    auto put = [&](const string &name, int score, score_source source, const string &reason) {
        result.dimensions[name] = {score, weight.at(name), source, reason};
    };

    int test_score = automatic ? (int)lround(automatic->test_score()) : 0;
    bool has_tests = automatic && automatic->tests_total > 0;

    int executes = automatic ? automatic->execution_score() : 5;
    put("executes", executes, score_source::AUTO, "Based on execution validation");

    put("test_pass_rate", test_score, score_source::AUTO,
        automatic ? fmt::format("{}/{} tests passed", automatic->tests_passed, automatic->tests_total) : "No tests");

    put("features_complete", judge ? judge->features_complete.score : 5, score_source::JUDGE,
        judge ? judge->features_complete.reason : "No judge score");

    int edge_cases = 5;
    if (has_tests)
        edge_cases = test_score;
    else if (judge)
        edge_cases = judge->output_quality.score;
    put("edge_cases", edge_cases, score_source::COMBINED, "Based on test results and output quality");

    int quality = 5;
    score_source quality_source = score_source::JUDGE;
    if (analysis && judge) {
        quality = (analysis->quality_score() + judge->code_quality.score) / 2;
        quality_source = score_source::COMBINED;
    } else if (analysis) {
        quality = analysis->quality_score();
        quality_source = score_source::STATIC;
    } else if (judge) {
        quality = judge->code_quality.score;
    }
    put("code_quality", quality, quality_source, "Based on static analysis and code review");

    put("efficiency", metrics ? efficiency_score(*metrics) : 7, score_source::METRICS,
        metrics ? fmt::format("Based on {} turns", metrics->turns) : "No metrics");

    put("direction_following", judge ? judge->direction_following.score : 5, score_source::JUDGE,
        judge ? judge->direction_following.reason : "No judge score");

    int robustness = automatic ? test_score : 5;
    if (analysis && analysis->has_error_handling)
        robustness = min(10, robustness + 1);
    put("robustness", robustness, score_source::COMBINED, "Based on test coverage and error handling");

    if (executes < EXECUTION_GATE_THRESHOLD)
        result.execution_gated = true;
    if (has_tests && automatic->test_score() < EXECUTION_GATE_THRESHOLD)
        result.execution_gated = true;
    return result;
}

score_aggregator::score_aggregator(browser_pool &pool, suite_registry registry, const multi_judge_arbitrator *judges)
    : scorer(pool, move(registry)), judges(judges) {}

final_score score_aggregator::score_workspace(const fs::path &workspace,
                                              const optional<fs::path> &case_dir,
                                              const optional<string> &spec,
                                              const optional<agent_metrics> &metrics) const {
    bool empty;
    try {
        empty = !fs::is_directory(workspace) || list_files_recursive(workspace).empty();
    } catch (const exception &e) {
        LOG(ERROR) << "Unable to list workspace " << workspace << ": " << e.what();
        empty = true;
    }
    if (empty) {
        LOG(WARNING) << "Workspace " << workspace << " is empty, skipping evaluation";
        return aggregate(auto_score(), nullopt, empty_workspace_score(), metrics);
    }

    auto_score automatic = scorer.score(workspace, case_dir);
    static_report analysis = static_analyzer().analyze(workspace);

    optional<absolute_score> judge;
    optional<multi_judge_score> judging;
    if (judges && spec) {
        try {
            judging = judges->score(*spec, workspace);
            judge = judging->as_absolute_score();
        } catch (const exception &e) {
            LOG(ERROR) << "Judging workspace " << workspace << " failed: " << e.what();
            judging.reset();
        }
    }

    final_score result = aggregate(automatic, analysis, judge, metrics);
    result.judging = judging;
    return result;
}

}  // namespace vibe
