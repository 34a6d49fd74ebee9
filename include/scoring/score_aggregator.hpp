#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "agent/actions.hpp"
#include "browser/browser_pool.hpp"
#include "judge/multi_judge.hpp"
#include "scoring/absolute_score.hpp"
#include "scoring/auto_scorer.hpp"
#include "scoring/static_analyzer.hpp"
#include "testing/suite_registry.hpp"

namespace vibe {

/**
 * @brief 维度分数的来源
 */
enum class score_source {
    AUTO,
    STATIC,
    JUDGE,
    COMBINED,
    METRICS
};

const char *get_display_message(score_source source);

score_source parse_score_source(const std::string &source);

struct dimension_result {
    /**
     * @brief 0-10
     */
    int score = 0;

    /**
     * @brief 0-1 的权重
     */
    double weight = 0;

    score_source source = score_source::AUTO;

    std::string reason;

    /**
     * @brief 对总分 (0-100) 的贡献
     */
    double weighted_contribution() const;
};

/**
 * @brief 综合所有评分来源的最终评分
 */
struct final_score {
    std::map<std::string, dimension_result> dimensions;

    bool execution_gated = false;

    std::optional<auto_score> automatic;
    std::optional<static_report> analysis;

    /**
     * @brief 多评审的详细结果，只用于报告
     */
    std::optional<multi_judge_score> judging;

    /**
     * @brief 各维度权重，顺序固定，总和为 1
     */
    static const std::vector<std::pair<std::string, double>> &weights();

    /**
     * @brief 加权总分 (0-100)，保留一位小数，触发执行门槛时不超过 30
     */
    double total_score() const;
};

void to_json(nlohmann::json &j, const dimension_result &result);
void from_json(const nlohmann::json &j, dimension_result &result);
void to_json(nlohmann::json &j, const final_score &score);
void from_json(const nlohmann::json &j, final_score &score);

/**
 * @brief 将自动评分、静态分析、评审评分与代理统计合并为 8 个维度的最终评分
 * 缺少的来源使用中性的默认值
 */
final_score aggregate(const std::optional<auto_score> &automatic,
                      const std::optional<static_report> &analysis,
                      const std::optional<absolute_score> &judge,
                      const std::optional<agent_metrics> &metrics);

/**
 * @brief 对一个工作区运行所有评分来源并合并
 */
class score_aggregator {
public:
    /**
     * @param judges 为空时不请求评审
     */
    score_aggregator(browser_pool &pool,
                     suite_registry registry,
                     const multi_judge_arbitrator *judges = nullptr);

    /**
     * @param case_dir 用例目录，用于查找测试集
     * @param spec 任务描述，为空时不请求评审
     */
    final_score score_workspace(const std::filesystem::path &workspace,
                                const std::optional<std::filesystem::path> &case_dir,
                                const std::optional<std::string> &spec,
                                const std::optional<agent_metrics> &metrics) const;

private:
    auto_scorer scorer;
    const multi_judge_arbitrator *judges;
};

}  // namespace vibe
