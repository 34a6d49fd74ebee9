#pragma once

#include <filesystem>
#include "browser/browser_pool.hpp"
#include "config.hpp"
#include "sandbox/execution_report.hpp"

namespace vibe {

/**
 * @brief 验证生成的代码是否能够运行
 *
 * 工作区中存在 Python 文件时验证 Python 入口：
 * 1. 语法检查，语法错误直接判定失败
 * 2. 导入检查，非法导入会被记录，但仍然尝试运行
 * 3. 在沙箱中运行入口文件，返回码非 0 或缺失模块判定失败
 *
 * 否则验证 HTML 入口：在无头浏览器中加载页面，收集未捕获的异常和
 * console.error 输出。浏览器不可用时退化为检查 <html> 和 <body> 标签。
 */
class execution_validator {
public:
    /**
     * @param pool 共享的浏览器，验证器不负责关闭
     * @param timeout 运行 Python 入口的超时时间，单位为秒
     * @param capture_screenshot HTML 验证时是否截图
     */
    explicit execution_validator(browser_pool &pool,
                                 double timeout = VALIDATION_TIME_LIMIT,
                                 bool capture_screenshot = true);

    /**
     * @brief 查找工作区的入口文件并验证，不会抛出异常
     */
    execution_report validate(const std::filesystem::path &workspace) const;

    execution_report validate_python(const std::filesystem::path &file, const std::filesystem::path &workspace) const;

    execution_report validate_html(const std::filesystem::path &file) const;

    /**
     * @brief 只检查 HTML 文件的结构
     */
    static execution_report validate_html_structure(const std::filesystem::path &file);

private:
    browser_pool &pool;
    double timeout;
    bool capture_screenshot;
};

}  // namespace vibe
