#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>
#include "browser/cdp_connection.hpp"

namespace vibe {

/**
 * @brief 一个无头浏览器标签页
 * 页面在构造时开始收集未捕获的脚本异常和 console.error 输出，
 * 析构时关闭标签页。页面只能在一个线程中使用。
 *
 * 元素查询使用 CSS 选择器，has_text 非空时只保留文本内容包含
 * has_text（不区分大小写）的元素。
 */
class browser_page {
public:
    /**
     * @param owned_context 非空时页面独占该浏览器上下文，关闭页面时一并销毁
     */
    browser_page(std::shared_ptr<cdp_connection> connection,
                 std::string target_id,
                 std::string session_id,
                 std::string owned_context = "");
    ~browser_page();

    browser_page(const browser_page &) = delete;
    browser_page &operator=(const browser_page &) = delete;

    /**
     * @brief 导航到 url 并等待 load 事件
     * @throw browser_error 导航失败或超时
     */
    void navigate(const std::string &url, int timeout_ms);

    /**
     * @brief 重新加载当前页面并等待 load 事件
     */
    void reload(int timeout_ms);

    /**
     * @brief 在页面中执行 JavaScript 表达式，Promise 会被等待
     * @return 表达式的值，无法序列化时为 null
     * @throw browser_error 表达式抛出异常
     */
    nlohmann::json evaluate(const std::string &expression);

    /**
     * @brief 匹配选择器的元素数量
     */
    int count(const std::string &selector, const std::string &has_text = "");

    /**
     * @brief 第一个匹配元素的 textContent
     * @throw browser_error 没有匹配的元素
     */
    std::string text_content(const std::string &selector = "body", const std::string &has_text = "");

    /**
     * @brief 点击第一个匹配的元素
     * @throw browser_error 没有匹配的元素
     */
    void click(const std::string &selector, const std::string &has_text = "");

    /**
     * @brief 设置第一个匹配的输入框的值，并触发 input 和 change 事件
     */
    void fill(const std::string &selector, const std::string &value);

    /**
     * @brief 向第一个匹配的元素发送一次按键
     * @param key KeyboardEvent.key，例如 Enter
     */
    void press(const std::string &selector, const std::string &key);

    void wait_for_timeout(int ms);

    /**
     * @brief 设置页面操作的默认超时时间，导航和重新加载使用各自的超时参数
     */
    void set_default_timeout(int ms);

    /**
     * @brief 截取当前页面
     * @return base64 编码的 PNG 图片
     */
    std::string screenshot();

    /**
     * @brief 目前为止收集到的错误，格式为 "JS Error: ..." 或 "Console error: ..."
     */
    std::vector<std::string> errors() const;

    void clear_errors();

    /**
     * @brief 关闭标签页，可重复调用，不会抛出异常
     */
    void close();

private:
    friend std::unique_ptr<browser_page> open_page(const std::shared_ptr<cdp_connection> &connection,
                                                   const std::string &context_id,
                                                   bool owns_context);

    void on_event(const std::string &method, const nlohmann::json &params);
    nlohmann::json call(const std::string &method,
                        const nlohmann::json &params = nlohmann::json::object(),
                        std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());
    bool element_action(const std::string &script);

    std::shared_ptr<cdp_connection> connection;
    std::string target_id, session_id, owned_context;
    int subscription = 0;
    std::chrono::milliseconds default_timeout = std::chrono::seconds(30);
    bool closed = false;

    mutable std::mutex state_mutex;
    std::condition_variable load_cv;
    int load_count = 0;
    std::set<std::string> loaded_documents;
    std::vector<std::string> collected_errors;
};

/**
 * @brief 一个隔离的浏览器上下文，相当于一个独立的隐身窗口
 * 上下文中的页面共享 cookie 和存储，析构时销毁整个上下文
 */
class browser_context {
public:
    browser_context(std::shared_ptr<cdp_connection> connection, std::string context_id);
    ~browser_context();

    browser_context(const browser_context &) = delete;
    browser_context &operator=(const browser_context &) = delete;

    /**
     * @brief 在该上下文中打开一个空白标签页
     * @throw browser_error
     */
    std::unique_ptr<browser_page> new_page();

    /**
     * @brief 销毁上下文，可重复调用，不会抛出异常
     */
    void close();

    const std::string &id() const;

private:
    std::shared_ptr<cdp_connection> connection;
    std::string context_id;
    bool closed = false;
};

/**
 * @brief 在 context_id 对应的上下文中打开一个空白标签页
 * @param owns_context 为真时页面关闭时一并销毁上下文，打开失败时同样会销毁
 * @throw browser_error
 */
std::unique_ptr<browser_page> open_page(const std::shared_ptr<cdp_connection> &connection,
                                        const std::string &context_id,
                                        bool owns_context);

}  // namespace vibe
