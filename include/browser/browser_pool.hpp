#pragma once

#include <sys/types.h>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "browser/cdp_connection.hpp"
#include "browser/page.hpp"

namespace vibe {

/**
 * @brief 查找可用的 Chromium 系浏览器
 * preferred 非空时只检查 preferred，否则依次检查 CHROME_PATH 配置、
 * CHROME_PATH 环境变量、PATH 中的常见名称和常见安装路径
 * @return 可执行文件路径，找不到时返回空
 */
std::optional<std::string> find_browser_executable(const std::string &preferred = "");

/**
 * @brief 进程内共享的无头浏览器
 * 浏览器在第一次请求页面时启动，之后所有验证和测试都复用同一个浏览器进程，
 * 每次请求只创建新的上下文或页面。浏览器进程需要显式调用 close() 关闭。
 *
 * 浏览器无法启动时，acquire_page/acquire_context 返回 nullptr，
 * 调用者据此退化为结构检查，而不是报错。
 */
class browser_pool {
public:
    /**
     * @param executable 浏览器路径，为空时自动查找，指定的路径不可用时浏览器不可用
     */
    explicit browser_pool(std::string executable = "");
    ~browser_pool();

    browser_pool(const browser_pool &) = delete;
    browser_pool &operator=(const browser_pool &) = delete;

    /**
     * @brief 启动浏览器，已经启动时直接返回
     * 启动失败以后不会再次尝试
     * @return 浏览器是否可用
     */
    bool open();

    /**
     * @brief 关闭浏览器进程并删除临时的 profile 目录
     */
    void close();

    /**
     * @brief 浏览器是否可用，必要时会启动浏览器
     */
    bool available();

    /**
     * @brief 创建一个隔离的浏览器上下文
     * @return 浏览器不可用时返回 nullptr
     * @throw browser_error 浏览器可用但创建失败
     */
    std::unique_ptr<browser_context> acquire_context();

    /**
     * @brief 创建一个拥有独立上下文的页面
     * @return 浏览器不可用时返回 nullptr
     * @throw browser_error 浏览器可用但创建失败
     */
    std::unique_ptr<browser_page> acquire_page();

private:
    std::shared_ptr<cdp_connection> connect();
    void launch();
    void terminate();

    std::string executable;
    std::mutex launch_mutex;
    bool failed = false;
    pid_t pid = -1;
    std::filesystem::path profile_dir;
    std::shared_ptr<cdp_connection> connection;
};

}  // namespace vibe
