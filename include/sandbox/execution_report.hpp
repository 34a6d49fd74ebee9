#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace vibe {

/**
 * @brief 被验证的入口文件类型
 */
enum class file_type {
    PYTHON,
    HTML,
    NONE
};

const char *get_display_message(file_type type);

file_type parse_file_type(const std::string &type);

/**
 * @brief 一次执行验证的结果
 * 每次验证都会创建新的报告，创建以后不再修改
 */
struct execution_report {
    /**
     * @brief 入口文件是否成功运行
     * Python: 返回码为 0，没有非法导入，没有缺失的模块
     * HTML: 加载过程中没有收集到任何错误
     */
    bool executed = false;

    int exit_code = 0;

    std::string stdout_text;

    std::string stderr_text;

    /**
     * @brief 执行时间，单位为秒
     */
    double execution_time = 0;

    std::vector<std::string> errors;

    std::vector<std::string> illegal_imports;

    /**
     * @brief 页面截图，base64 编码的 PNG，只在 HTML 验证时存在，不会被序列化
     */
    std::optional<std::string> screenshot;

    file_type type = file_type::NONE;
};

/**
 * @brief 序列化执行报告，stdout 和 stderr 被截断为 REPORT_OUTPUT_CHARS 个字符
 */
void to_json(nlohmann::json &j, const execution_report &report);

void from_json(const nlohmann::json &j, execution_report &report);

}  // namespace vibe
