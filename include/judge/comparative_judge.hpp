#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "judge/http_judge_client.hpp"
#include "judge/judge_client.hpp"
#include "scoring/absolute_score.hpp"

namespace vibe {

enum class comparison_winner {
    A,
    B,
    TIE
};

const char *get_display_message(comparison_winner winner);

/**
 * @brief 不区分大小写，无法识别的取值视为 TIE
 */
comparison_winner parse_comparison_winner(const std::string &winner);

enum class comparison_confidence {
    HIGH,
    MEDIUM,
    LOW
};

const char *get_display_message(comparison_confidence confidence);

/**
 * @brief 不区分大小写，无法识别的取值视为 MEDIUM
 */
comparison_confidence parse_comparison_confidence(const std::string &confidence);

/**
 * @brief 两份实现一对一比较的结果
 */
struct comparison_result {
    comparison_winner winner = comparison_winner::TIE;
    comparison_confidence confidence = comparison_confidence::MEDIUM;
    std::string reasoning;
    std::string model_a, model_b;

    std::optional<judge_metrics> metrics;

    /**
     * @brief 胜者的模型名，平局时为 "TIE"
     */
    std::string winner_name() const;
};

void to_json(nlohmann::json &j, const comparison_result &result);
void from_json(const nlohmann::json &j, comparison_result &result);

std::string build_comparison_prompt(const std::string &spec, const code_files &files_a, const code_files &files_b);

/**
 * @brief 将比较回复解析为结果
 * 回复无法解析或缺少 winner 时判为低置信度的平局，原因为 "Judge parsing error: ..."
 */
comparison_result parse_comparison_reply(const std::string &reply,
                                         const std::string &model_a,
                                         const std::string &model_b);

/**
 * @brief 让评审在同一任务的两份实现中选出更好的一份
 */
class comparative_judge {
public:
    explicit comparative_judge(judge_config config);

    /**
     * @brief 一方没有任何代码时直接判另一方胜出，不发出请求
     * @throw network_error 请求失败
     */
    comparison_result compare(const std::string &spec,
                              const code_files &files_a,
                              const code_files &files_b,
                              const std::string &model_a,
                              const std::string &model_b) const;

    comparison_result compare(const std::string &spec,
                              const std::filesystem::path &workspace_a,
                              const std::filesystem::path &workspace_b,
                              const std::string &model_a,
                              const std::string &model_b) const;

private:
    http_judge_client client;
};

/**
 * @brief 两两比较所有模型的工作区
 * @param workspaces (模型名, 工作区)，按给定顺序组成 (i, j), i < j 的比较
 */
std::vector<comparison_result> run_all_comparisons(const std::string &spec,
                                                   const std::vector<std::pair<std::string, std::filesystem::path>> &workspaces,
                                                   const comparative_judge &judge);

}  // namespace vibe
