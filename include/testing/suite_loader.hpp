#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include "testing/test_suite.hpp"

namespace vibe {

/**
 * @brief 从声明式的 JSON 测试描述构建测试集
 *
 * 格式为 {"tests": [{"name": "test_x", "steps": [{"action": "click", ...}, ...]}]}。
 * 页面步骤：click, fill, press, wait, reload, expect_count, expect_text, expect_eval, expect_no_errors。
 * 脚本步骤：run, run_shell, expect_exit_code, expect_stdout_contains, expect_stderr_not_contains,
 * expect_file, expect_compiles, expect_source_contains, expect_source_not_contains。
 * 同一个测试不能混用页面步骤和脚本步骤。
 *
 * @throw std::invalid_argument 描述格式不正确
 */
test_suite load_suite(const nlohmann::json &source);

/**
 * @brief 读取并解析 tests.json
 * @throw std::invalid_argument 文件内容不是合法的 JSON 或格式不正确
 * @throw internal_error 文件无法读取
 */
test_suite load_suite_file(const std::filesystem::path &path);

}  // namespace vibe
