#include "judge/comparative_judge.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <unordered_map>
#include "common/json_utils.hpp"

namespace vibe {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

// clang-format off
static const unordered_map<comparison_winner, const char *> comparison_winner_string = boost::assign::map_list_of
    (comparison_winner::A, "A")
    (comparison_winner::B, "B")
    (comparison_winner::TIE, "TIE");

static const unordered_map<comparison_confidence, const char *> comparison_confidence_string = boost::assign::map_list_of
    (comparison_confidence::HIGH, "high")
    (comparison_confidence::MEDIUM, "medium")
    (comparison_confidence::LOW, "low");
// clang-format on

const char *get_display_message(comparison_winner winner) {
    return comparison_winner_string.at(winner);
}

comparison_winner parse_comparison_winner(const string &winner) {
    string upper = boost::algorithm::to_upper_copy(winner);
    for (auto &[key, value] : comparison_winner_string)
        if (upper == value) return key;
    return comparison_winner::TIE;
}

const char *get_display_message(comparison_confidence confidence) {
    return comparison_confidence_string.at(confidence);
}

comparison_confidence parse_comparison_confidence(const string &confidence) {
    string lower = boost::algorithm::to_lower_copy(confidence);
    for (auto &[key, value] : comparison_confidence_string)
        if (lower == value) return key;
    return comparison_confidence::MEDIUM;
}

string comparison_result::winner_name() const {
    switch (winner) {
        case comparison_winner::A:
            return model_a;
        case comparison_winner::B:
            return model_b;
        default:
            return "TIE";
    }
}

void to_json(json &j, const comparison_result &result) {
    j = {{"winner", get_display_message(result.winner)},
         {"winner_name", result.winner_name()},
         {"confidence", get_display_message(result.confidence)},
         {"reasoning", result.reasoning},
         {"model_a", result.model_a},
         {"model_b", result.model_b}};
    if (result.metrics) j["judge_metrics"] = *result.metrics;
}

void from_json(const json &j, comparison_result &result) {
    result.winner = parse_comparison_winner(get_value<string>(j, "winner"));
    result.confidence = parse_comparison_confidence(get_value_def<string>(j, "medium", "confidence"));
    result.reasoning = get_value_def<string>(j, "", "reasoning");
    result.model_a = get_value<string>(j, "model_a");
    result.model_b = get_value<string>(j, "model_b");
    if (exists(j, "judge_metrics")) result.metrics = get_value<judge_metrics>(j, "judge_metrics");
}

string build_comparison_prompt(const string &spec, const code_files &files_a, const code_files &files_b) {
    return fmt::format(R"(You are comparing two AI-generated codebases for the same specification.

## Specification:
{}

## Implementation A:
{}

## Implementation B:
{}

## Your Task:
Determine which implementation better fulfills the specification. Consider:
1. Completeness - Does it implement all requested features?
2. Correctness - Would it actually work as intended?
3. Code Quality - Is it well-organized and readable?
4. Direction Following - Did it build what was asked?

Respond ONLY with JSON in this exact format:
{{
  "winner": "A" or "B" or "TIE",
  "confidence": "high" or "medium" or "low",
  "reasoning": "Brief explanation of why this implementation is better (2-3 sentences)"
}}
)",
                       spec, format_code_files(files_a), format_code_files(files_b));
}

comparison_result parse_comparison_reply(const string &reply, const string &model_a, const string &model_b) {
    comparison_result result;
    result.model_a = model_a;
    result.model_b = model_b;
    try {
        json j = json::parse(extract_json(reply));
        result.winner = parse_comparison_winner(get_value<string>(j, "winner"));
        result.confidence = parse_comparison_confidence(get_value_def<string>(j, "medium", "confidence"));
        result.reasoning = get_value_def<string>(j, "No reasoning provided", "reasoning");
    } catch (const exception &e) {
        result.winner = comparison_winner::TIE;
        result.confidence = comparison_confidence::LOW;
        result.reasoning = fmt::format("Judge parsing error: {}", e.what());
    }
    return result;
}

comparative_judge::comparative_judge(judge_config config)
    : client(move(config)) {}

static comparison_result forfeit(comparison_winner winner, string reasoning, const string &model_a, const string &model_b) {
    comparison_result result;
    result.winner = winner;
    result.confidence = comparison_confidence::HIGH;
    result.reasoning = move(reasoning);
    result.model_a = model_a;
    result.model_b = model_b;
    return result;
}

comparison_result comparative_judge::compare(const string &spec,
                                             const code_files &files_a,
                                             const code_files &files_b,
                                             const string &model_a,
                                             const string &model_b) const {
    if (files_a.empty() && files_b.empty())
        return forfeit(comparison_winner::TIE, "Neither model produced any code", model_a, model_b);
    if (files_a.empty())
        return forfeit(comparison_winner::B, "Model A produced no code", model_a, model_b);
    if (files_b.empty())
        return forfeit(comparison_winner::A, "Model B produced no code", model_a, model_b);

    LOG(INFO) << "Requesting judge " << client.id() << " to compare " << model_a << " with " << model_b;
    auto [content, metrics] = client.complete(build_comparison_prompt(spec, files_a, files_b));
    comparison_result result = parse_comparison_reply(content, model_a, model_b);
    result.metrics = metrics;
    return result;
}

comparison_result comparative_judge::compare(const string &spec,
                                             const fs::path &workspace_a,
                                             const fs::path &workspace_b,
                                             const string &model_a,
                                             const string &model_b) const {
    return compare(spec, collect_code_files(workspace_a), collect_code_files(workspace_b), model_a, model_b);
}

vector<comparison_result> run_all_comparisons(const string &spec,
                                              const vector<pair<string, fs::path>> &workspaces,
                                              const comparative_judge &judge) {
    vector<comparison_result> results;
    for (size_t i = 0; i < workspaces.size(); ++i)
        for (size_t j = i + 1; j < workspaces.size(); ++j)
            results.push_back(judge.compare(spec, workspaces[i].second, workspaces[j].second,
                                            workspaces[i].first, workspaces[j].first));
    return results;
}

}  // namespace vibe
