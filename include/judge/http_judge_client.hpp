#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "config.hpp"
#include "judge/judge_client.hpp"

namespace vibe {

/**
 * @brief 一个评审的配置
 */
struct judge_config {
    /**
     * @brief 评审标识，缺省时与 model 相同
     */
    std::string id;

    std::string model;

    /**
     * @brief OpenAI 兼容的 chat completions 地址
     */
    std::string endpoint = "https://openrouter.ai/api/v1/chat/completions";

    /**
     * @brief 保存 API key 的环境变量名
     */
    std::string api_key_env = "OPENROUTER_API_KEY";

    /**
     * @brief 单次请求的超时时间，单位为秒
     */
    double timeout = JUDGE_TIME_LIMIT;

    int max_tokens = 4096;
};

void from_json(const nlohmann::json &j, judge_config &config);
void to_json(nlohmann::json &j, const judge_config &config);

/**
 * @brief 通过 OpenAI 兼容的 HTTP 接口调用模型进行评审，temperature 固定为 0
 */
class http_judge_client : public judge_client {
public:
    explicit http_judge_client(judge_config config);

    std::string id() const override;

    absolute_score score(const std::string &spec,
                         const code_files &files,
                         const std::optional<std::string> &criteria) const override;

    /**
     * @brief 发送一次对话请求
     * @return 回复内容与 token 用量
     * @throw network_error 网络错误、HTTP 错误或者回复格式不正确
     */
    std::pair<std::string, judge_metrics> complete(const std::string &prompt) const;

private:
    judge_config config;
};

}  // namespace vibe
