#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>
#include "browser/browser_pool.hpp"
#include "config.hpp"
#include "testing/suite_registry.hpp"
#include "testing/test_runner.hpp"

namespace vibe {

/**
 * @brief 基于功能测试结果的自动评分，不涉及任何模型评审
 */
struct auto_score {
    /**
     * @brief 0-1
     */
    double test_pass_rate = 0;

    int tests_passed = 0;
    int tests_failed = 0;
    int tests_total = 0;

    /**
     * @brief 代码是否能够运行
     */
    bool execution_success = false;

    std::vector<test_result> test_details;

    /**
     * @brief test_pass_rate * 10，保留小数
     */
    double test_score() const;

    /**
     * @brief 不能运行为 0，能运行但没有测试为 5，通过率超过一半为 10，否则为 7
     */
    int execution_score() const;
};

void to_json(nlohmann::json &j, const auto_score &score);
void from_json(const nlohmann::json &j, auto_score &score);

/**
 * @brief 运行功能测试并换算为自动评分
 * 找不到测试集时退化为只检查代码能否运行
 */
class auto_scorer {
public:
    /**
     * @param fallback_timeout 没有测试集时执行验证的超时时间，单位为秒
     */
    auto_scorer(browser_pool &pool,
                suite_registry registry,
                double timeout = TEST_TIME_LIMIT,
                double fallback_timeout = 15);

    /**
     * @param case_dir 用例目录，为空时只检查代码能否运行
     */
    auto_score score(const std::filesystem::path &workspace,
                     const std::optional<std::filesystem::path> &case_dir = std::nullopt) const;

    auto_score score(const std::filesystem::path &workspace, const test_suite &suite) const;

private:
    auto_score execution_only(const std::filesystem::path &workspace) const;

    browser_pool &pool;
    suite_registry registry;
    functional_test_runner runner;
    double fallback_timeout;
};

}  // namespace vibe
