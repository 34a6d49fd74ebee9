#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

namespace vibe {

/**
 * @brief 通过 --remote-debugging-pipe 与浏览器通信的 DevTools 协议连接
 * 消息是以 '\0' 分隔的 JSON。请求通过自增的 id 与响应对应，
 * 事件按照 sessionId 分发给订阅者。所有方法都是线程安全的。
 */
class cdp_connection {
public:
    /**
     * @brief 事件回调，在读线程中执行，不允许在回调中调用 call
     */
    using event_handler = std::function<void(const std::string &method, const nlohmann::json &params)>;

    /**
     * @param write_fd 写入命令的管道，对应浏览器的 fd 3
     * @param read_fd 读取响应的管道，对应浏览器的 fd 4
     * 连接接管这两个文件描述符的所有权
     */
    cdp_connection(int write_fd, int read_fd);
    ~cdp_connection();

    cdp_connection(const cdp_connection &) = delete;
    cdp_connection &operator=(const cdp_connection &) = delete;

    /**
     * @brief 发送一条命令并等待响应
     * @param method 协议方法名，例如 Page.navigate
     * @param params 命令参数
     * @param session_id 目标会话，为空表示发送给浏览器本身
     * @param timeout 等待响应的时间
     * @return 响应中的 result 字段
     * @throw browser_error 协议返回错误、连接断开或超时
     */
    nlohmann::json call(const std::string &method,
                        const nlohmann::json &params = nlohmann::json::object(),
                        const std::string &session_id = "",
                        std::chrono::milliseconds timeout = std::chrono::seconds(30));

    /**
     * @brief 订阅某个会话的事件
     * @return 用于取消订阅的标识
     */
    int subscribe(const std::string &session_id, event_handler handler);

    /**
     * @brief 取消订阅，返回以后保证该回调不会再被调用
     */
    void unsubscribe(int token);

    bool alive() const;

    /**
     * @brief 关闭连接，所有等待中的请求都会失败
     */
    void close();

private:
    void send(const nlohmann::json &message);
    void reader_loop();
    void dispatch(const nlohmann::json &message);
    void fail_pending(const std::string &reason);

    int write_fd, read_fd;
    std::atomic<bool> closed{false};

    std::mutex write_mutex;

    std::mutex state_mutex;
    int next_id = 1;
    std::map<int, std::shared_ptr<std::promise<nlohmann::json>>> pending;

    // 回调在持有 dispatch_mutex 时执行，unsubscribe 通过它等待正在执行的回调结束
    std::mutex dispatch_mutex;
    int next_token = 1;
    std::map<int, std::pair<std::string, event_handler>> handlers;

    std::thread reader;
};

}  // namespace vibe
