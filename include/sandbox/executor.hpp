#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"

namespace vibe {

/**
 * @brief 沙箱中一条命令的执行结果
 */
struct execution_result {
    /**
     * @brief 返回码为 0 时为真
     */
    bool success = false;

    /**
     * @brief 捕获的标准输出，超出字符上限时被截断
     */
    std::string stdout_text;

    /**
     * @brief 捕获的标准错误输出，超出字符上限时被截断
     * 命令被拦截或超时时，这里保存说明信息
     */
    std::string stderr_text;

    /**
     * @brief 进程返回码
     * 被信号终止时为负的信号编号，超时时为 -1，被拦截时为 1
     */
    int return_code = 0;

    bool timed_out = false;

    /**
     * @brief 执行时间，单位为秒
     */
    double execution_time = 0;
};

/**
 * @brief 在 workdir 中通过 /bin/sh 执行一条命令
 * 命令先经过包管理器拦截检查，被拦截的命令不会创建任何子进程。
 * 子进程位于独立的进程组中，超时时整个进程组都会被杀死。
 * @param command shell 命令
 * @param workdir 子进程的工作目录
 * @param timeout 墙上时间限制，单位为秒
 * @param max_output_chars stdout 和 stderr 各自保留的最大字符数
 * @param input 写入子进程标准输入的内容，为空时标准输入为 /dev/null
 */
execution_result run_command(const std::string &command,
                             const std::filesystem::path &workdir,
                             double timeout,
                             size_t max_output_chars = MAX_OUTPUT_CHARS,
                             const std::string &input = "");

/**
 * @brief 绑定到一个工作区的沙箱
 * 工作区内的文件读写都经过路径检查，不允许跳出工作区
 */
class sandbox_executor {
public:
    explicit sandbox_executor(const std::filesystem::path &workspace,
                              double timeout = SANDBOX_TIME_LIMIT,
                              size_t max_output_chars = MAX_OUTPUT_CHARS);

    execution_result run(const std::string &command) const;

    execution_result run(const std::string &command, double timeout, const std::string &input = "") const;

    /**
     * @brief 写入工作区中的文件，会自动创建父文件夹
     * @throw std::invalid_argument 路径跳出工作区
     */
    void write_file(const std::string &path, const std::string &content) const;

    /**
     * @brief 读取工作区中的文件
     * @return 文件内容，文件不存在时返回空
     */
    std::optional<std::string> read_file(const std::string &path) const;

    /**
     * @brief 递归列出工作区中的文件，按字典序排序
     */
    std::vector<std::string> list_files() const;

    /**
     * @brief 删除工作区
     */
    void cleanup() const;

    const std::filesystem::path &workspace() const;

    double timeout() const;

private:
    std::filesystem::path workspace_dir;
    double time_limit;
    size_t max_output;
};

}  // namespace vibe
