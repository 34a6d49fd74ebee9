#pragma once

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "config.hpp"
#include "judge/http_judge_client.hpp"
#include "judge/judge_client.hpp"
#include "scoring/absolute_score.hpp"

namespace vibe {

enum class aggregation_mode {
    AVERAGE,
    MEDIAN,
    /**
     * @brief 与 MEDIAN 的计算方式相同
     */
    CONSENSUS
};

const char *get_display_message(aggregation_mode mode);

/**
 * @throw std::invalid_argument 未知的聚合方式
 */
aggregation_mode parse_aggregation_mode(const std::string &mode);

/**
 * @brief 多个评审的聚合结果
 */
struct multi_judge_score {
    std::map<std::string, absolute_score> individual_scores;

    double final_score = 0;

    /**
     * @brief 各维度按照与总分相同的统计方式聚合后的分数
     */
    std::map<std::string, double> aggregated_dimensions;

    /**
     * @brief spread 超过阈值，或者没有任何评审
     */
    bool disagreement_flag = false;

    /**
     * @brief 最高总分与最低总分之差
     */
    double spread = 0;

    /**
     * @brief 参与聚合的评审，按配置顺序排列，失败的评审以全 0 分参与
     */
    std::vector<std::string> judges_used;

    aggregation_mode mode = aggregation_mode::MEDIAN;

    std::map<std::string, double> dimension_spreads;

    /**
     * @brief 返回了真实评分的评审消耗的 token 总数
     */
    long total_judge_tokens() const;

    double total_judge_cost() const;

    /**
     * @brief 将聚合后的维度分数四舍五入为整数，转换为单个评审的评分
     */
    absolute_score as_absolute_score() const;
};

void to_json(nlohmann::json &j, const multi_judge_score &score);
void from_json(const nlohmann::json &j, multi_judge_score &score);

/**
 * @brief 聚合多个评审的评分，结果只取决于输入
 * @param scores 按评审顺序排列的 (评审标识, 评分)
 * @param threshold 分歧阈值
 */
multi_judge_score aggregate_scores(const std::vector<std::pair<std::string, absolute_score>> &scores,
                                   aggregation_mode mode,
                                   double threshold);

/**
 * @brief 多评审仲裁配置
 */
struct arbitration_config {
    aggregation_mode mode = aggregation_mode::MEDIAN;
    double threshold = DISAGREEMENT_THRESHOLD;
    std::vector<judge_config> judges;
};

void from_json(const nlohmann::json &j, arbitration_config &config);

/**
 * @brief 默认的三个评审
 */
std::vector<judge_config> default_judges();

/**
 * @brief 同时请求多个评审并聚合结果
 *
 * 每个评审在独立的线程中运行，有各自的超时时间。失败或超时的评审不会重试，
 * 以全 0 的评分参与聚合，原因记录在 executes 维度中。超时评审的线程仍归仲裁器所有，
 * 析构时等待其结束，因此仲裁器必须在 curl_global_cleanup 之前析构。
 */
class multi_judge_arbitrator {
public:
    multi_judge_arbitrator(std::vector<std::pair<std::shared_ptr<const judge_client>, double>> judges,
                           aggregation_mode mode = aggregation_mode::MEDIAN,
                           double threshold = DISAGREEMENT_THRESHOLD);

    /**
     * @brief 根据配置创建 HTTP 评审，没有配置评审时使用默认评审
     */
    explicit multi_judge_arbitrator(const arbitration_config &config);

    /**
     * @brief 等待所有仍在运行的评审线程结束，包括已经超时的评审
     */
    ~multi_judge_arbitrator();

    multi_judge_arbitrator(const multi_judge_arbitrator &) = delete;
    multi_judge_arbitrator &operator=(const multi_judge_arbitrator &) = delete;

    multi_judge_score score(const std::string &spec,
                            const std::filesystem::path &workspace,
                            const std::optional<std::string> &criteria = std::nullopt) const;

    multi_judge_score score(const std::string &spec,
                            const code_files &files,
                            const std::optional<std::string> &criteria = std::nullopt) const;

    aggregation_mode mode() const;

    size_t size() const;

private:
    struct worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    /**
     * @brief 回收已经结束的评审线程
     */
    void reap_workers(bool wait) const;

    std::vector<std::pair<std::shared_ptr<const judge_client>, double>> judges;
    aggregation_mode aggregation;
    double threshold;

    mutable std::mutex workers_mutex;
    mutable std::vector<worker> workers;
};

}  // namespace vibe
