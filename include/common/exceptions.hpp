#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace vibe {

struct eval_exception : std::exception {
    eval_exception();
    explicit eval_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const eval_exception &ex);

    template <typename T>
    eval_exception operator<<(const T &t) const {
        return eval_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测引擎的内部错误
 * 一般是嵌入的 Python 解释器或者系统调用出现了问题
 */
struct internal_error : public eval_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 */
struct network_error : public eval_exception {
    network_error();
    explicit network_error(const std::string &message);
};

/**
 * @brief 表示无头浏览器的错误
 * 包括浏览器无法启动、DevTools 协议返回错误、页面加载超时等
 */
struct browser_error : public eval_exception {
    browser_error();
    explicit browser_error(const std::string &message);
};

/**
 * @brief 表示被评测代码存在语法错误
 */
struct syntax_error : public eval_exception {
    syntax_error(const std::string &message, int line);

    /**
     * @brief 出错的行号，未知时为 0
     */
    int line;
};

/**
 * @brief 测试用例中的断言失败
 * 与其他异常不同，测试运行器会把它记录为测试不通过而不是测试出错
 */
struct assertion_failure : public eval_exception {
    assertion_failure();
    explicit assertion_failure(const std::string &message);
};

/**
 * @brief 异常的类型名，不含命名空间，例如 browser_error
 */
std::string exception_type_name(const std::exception &e);

}  // namespace vibe
