#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace vibe {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 截断过长的程序输出
 * 超出 max_chars 的部分被丢弃，并追加一行说明原始长度
 * @param text 原始输出
 * @param max_chars 保留的最大字符数
 * @return 截断后的文本，若未超出则原样返回
 */
std::string truncate_output(const std::string &text, size_t max_chars);

/**
 * @brief 截断文本，超出部分用 suffix 代替
 */
std::string truncate_text(const std::string &text, size_t max_chars, const std::string &suffix);

/**
 * @brief 四舍五入到小数点后 digits 位，用于输出报告
 */
double round_to(double value, int digits);

/**
 * @brief 将文本转义为单引号包裹的 shell 参数
 */
std::string shell_quote(const std::string &arg);

/**
 * @brief 将本地文件路径转换为 file:// URL，对特殊字符做百分号编码
 */
std::string file_url(const std::filesystem::path &path);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief 经过的时间，单位为秒
     */
    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace vibe
