#pragma once

#include <filesystem>
#include <string>

namespace vibe {

/**
 * @brief 沙箱执行命令的默认超时时间，单位为秒
 */
extern double SANDBOX_TIME_LIMIT;

/**
 * @brief 执行验证时运行 Python 入口文件的超时时间，单位为秒
 */
extern double VALIDATION_TIME_LIMIT;

/**
 * @brief 功能测试中单个脚本调用的默认超时时间，单位为秒
 */
extern double TEST_TIME_LIMIT;

/**
 * @brief 浏览器页面加载的超时时间，单位为毫秒
 * 超时只会中止当前页面，不会重启浏览器
 */
extern int PAGE_LOAD_TIMEOUT;

/**
 * @brief 页面加载完成后等待前端脚本初始化的时间，单位为毫秒
 */
extern int PAGE_SETTLE_TIME;

/**
 * @brief 沙箱捕获的 stdout/stderr 的最大字符数
 */
extern size_t MAX_OUTPUT_CHARS;

/**
 * @brief 执行报告中保存的 stdout/stderr 的最大字符数
 */
extern size_t REPORT_OUTPUT_CHARS;

/**
 * @brief 单个评委请求的超时时间，单位为秒
 */
extern double JUDGE_TIME_LIMIT;

/**
 * @brief 评委总分的极差超过该值时标记为存在分歧
 */
extern double DISAGREEMENT_THRESHOLD;

/**
 * @brief 运行被评测 Python 代码的解释器
 * 与嵌入的解释器无关，沙箱以子进程的方式调用
 */
extern std::string PYTHON_EXECUTABLE;

/**
 * @brief 无头浏览器的路径，为空时按照常见安装路径查找
 */
extern std::string CHROME_PATH;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，浏览器的 profile 目录不会被删除，
 * 并且会输出每条执行的命令，以便手动检查。
 */
extern bool DEBUG;

}  // namespace vibe
