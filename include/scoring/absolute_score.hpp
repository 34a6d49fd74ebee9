#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vibe {

/**
 * @brief 单个评分维度的得分
 */
struct dimension_score {
    /**
     * @brief 0-10 的整数分
     */
    int score = 0;

    std::string reason;
};

/**
 * @brief 一次评审调用消耗的 token
 */
struct judge_metrics {
    long input_tokens = 0;
    long output_tokens = 0;
    std::string judge_model;

    long total_tokens() const;

    /**
     * @brief 按每百万 token 的价格估算费用（美元），保留 6 位小数
     * 未知模型按 3/15 美元计算
     */
    double estimated_cost() const;
};

/**
 * @brief 评审对一个工作区的 5 维度评分
 */
struct absolute_score {
    dimension_score executes;
    dimension_score features_complete;
    dimension_score output_quality;
    dimension_score direction_following;
    dimension_score code_quality;

    std::optional<judge_metrics> metrics;

    /**
     * @brief 各维度权重，顺序固定，总和为 100
     */
    static const std::vector<std::pair<std::string, int>> &weights();

    /**
     * @brief 维度名称，顺序与 weights() 一致
     */
    static const std::vector<std::string> &dimension_names();

    dimension_score &dimension(const std::string &name);
    const dimension_score &dimension(const std::string &name) const;

    /**
     * @brief 加权总分 (0-100)，保留一位小数
     * executes 低于 EXECUTION_GATE_THRESHOLD 时不超过 EXECUTION_GATE_CAP
     */
    double total_score() const;

    bool execution_gated() const;

    /**
     * @brief 所有维度都为 0 的评分
     * @param reason executes 维度的原因
     * @param others 其他维度的原因
     */
    static absolute_score zero(const std::string &reason, const std::string &others);
};

constexpr int EXECUTION_GATE_THRESHOLD = 3;
constexpr double EXECUTION_GATE_CAP = 30;

void to_json(nlohmann::json &j, const dimension_score &score);
void from_json(const nlohmann::json &j, dimension_score &score);
void to_json(nlohmann::json &j, const judge_metrics &metrics);
void from_json(const nlohmann::json &j, judge_metrics &metrics);
void to_json(nlohmann::json &j, const absolute_score &score);
void from_json(const nlohmann::json &j, absolute_score &score);

}  // namespace vibe
