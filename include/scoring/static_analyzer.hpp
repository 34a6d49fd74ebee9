#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace vibe {

/**
 * @brief 静态分析发现的问题，file 为文件名
 */
struct static_issue {
    std::string file;
    int line = 0;
    std::string type;
    std::string message;
};

/**
 * @brief 工作区的代码质量报告
 */
struct static_report {
    int files_analyzed = 0;
    int total_lines = 0;

    double avg_function_length = 0;
    int max_function_length = 0;

    /**
     * @brief 简化的圈复杂度，所有 Python 文件的复杂度之和除以函数个数
     */
    double cyclomatic_complexity = 0;

    bool has_docstrings = false;
    double docstring_coverage = 0;
    bool has_type_hints = false;
    double type_hint_coverage = 0;

    int syntax_errors = 0;

    /**
     * @brief 超过 120 个字符的行数
     */
    int long_lines = 0;

    int todo_count = 0;

    /**
     * @brief print 与 console.* 调用的数量
     */
    int console_logs = 0;

    bool has_error_handling = false;
    int try_except_count = 0;

    std::vector<static_issue> issues;

    /**
     * @brief 0-10 的质量分，从 10 分开始按问题扣分
     */
    int quality_score() const;
};

void to_json(nlohmann::json &j, const static_issue &issue);
void from_json(const nlohmann::json &j, static_issue &issue);
void to_json(nlohmann::json &j, const static_report &report);
void from_json(const nlohmann::json &j, static_report &report);

/**
 * @brief 不运行代码，分析工作区中 .py, .html 和 .js 文件的代码质量
 */
class static_analyzer {
public:
    static_report analyze(const std::filesystem::path &workspace) const;
};

}  // namespace vibe
