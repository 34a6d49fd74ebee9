#include "scoring/absolute_score.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace vibe {
using namespace std;
using namespace nlohmann;

// 每百万 token 的价格（输入，输出）
// clang-format off
static const unordered_map<string, pair<double, double>> judge_pricing = boost::assign::map_list_of
    ("anthropic/claude-opus-4.5", make_pair(5.0, 25.0))
    ("anthropic/claude-sonnet-4", make_pair(3.0, 15.0))
    ("openai/gpt-4o", make_pair(3.0, 10.0))
    ("google/gemini-3-flash", make_pair(0.075, 0.3))
    ("google/gemini-2.0-flash", make_pair(0.075, 0.3));
// clang-format on

static const pair<double, double> default_pricing(3.0, 15.0);

long judge_metrics::total_tokens() const {
    return input_tokens + output_tokens;
}

double judge_metrics::estimated_cost() const {
    auto it = judge_pricing.find(boost::algorithm::to_lower_copy(judge_model));
    auto [input_rate, output_rate] = it == judge_pricing.end() ? default_pricing : it->second;
    double cost = input_tokens / 1e6 * input_rate + output_tokens / 1e6 * output_rate;
    return round_to(cost, 6);
}

const vector<pair<string, int>> &absolute_score::weights() {
    static const vector<pair<string, int>> table = {
        {"executes", 25},
        {"features_complete", 30},
        {"output_quality", 20},
        {"direction_following", 10},
        {"code_quality", 15}};
    return table;
}

const vector<string> &absolute_score::dimension_names() {
    static const vector<string> names = [] {
        vector<string> result;
        for (auto &[name, weight] : weights()) result.push_back(name);
        return result;
    }();
    return names;
}

dimension_score &absolute_score::dimension(const string &name) {
    if (name == "executes") return executes;
    if (name == "features_complete") return features_complete;
    if (name == "output_quality") return output_quality;
    if (name == "direction_following") return direction_following;
    if (name == "code_quality") return code_quality;
    throw invalid_argument("unknown dimension " + name);
}

const dimension_score &absolute_score::dimension(const string &name) const {
    return const_cast<absolute_score *>(this)->dimension(name);
}

double absolute_score::total_score() const {
    double total = 0;
    for (auto &[name, weight] : weights())
        total += dimension(name).score / 10.0 * weight;
    if (execution_gated())
        total = min(total, EXECUTION_GATE_CAP);
    return round_to(total, 1);
}

bool absolute_score::execution_gated() const {
    return executes.score < EXECUTION_GATE_THRESHOLD;
}

absolute_score absolute_score::zero(const string &reason, const string &others) {
    absolute_score score;
    for (auto &name : dimension_names()) score.dimension(name) = {0, others};
    score.executes.reason = reason;
    return score;
}

void to_json(json &j, const dimension_score &score) {
    j = {{"score", score.score}, {"reason", score.reason}};
}

void from_json(const json &j, dimension_score &score) {
    score.score = get_value<int>(j, "score");
    score.reason = get_value_def<string>(j, "", "reason");
}

void to_json(json &j, const judge_metrics &metrics) {
    j = {{"input_tokens", metrics.input_tokens},
         {"output_tokens", metrics.output_tokens},
         {"total_tokens", metrics.total_tokens()},
         {"judge_model", metrics.judge_model},
         {"estimated_cost", metrics.estimated_cost()}};
}

void from_json(const json &j, judge_metrics &metrics) {
    metrics.input_tokens = get_value_def<long>(j, 0, "input_tokens");
    metrics.output_tokens = get_value_def<long>(j, 0, "output_tokens");
    metrics.judge_model = get_value_def<string>(j, "", "judge_model");
}

void to_json(json &j, const absolute_score &score) {
    j = json::object();
    for (auto &name : absolute_score::dimension_names())
        j[name] = score.dimension(name);
    j["total_score"] = score.total_score();
    j["execution_gated"] = score.execution_gated();
    if (score.metrics) j["judge_metrics"] = *score.metrics;
}

void from_json(const json &j, absolute_score &score) {
    for (auto &name : absolute_score::dimension_names())
        score.dimension(name) = get_value<dimension_score>(j, name);
    score.metrics.reset();
    if (exists(j, "judge_metrics")) score.metrics = get_value<judge_metrics>(j, "judge_metrics");
}

}  // namespace vibe
