#pragma once

#include <optional>
#include <string>
#include <vector>

namespace vibe {

/**
 * @brief 被拦截命令的 stderr 中一定包含的标记
 */
extern const char *const BLOCKED_MARKER;

/**
 * @brief 所有被禁止的包管理器调用片段，均为小写
 */
const std::vector<std::string> &blocked_command_patterns();

/**
 * @brief 查找命令中出现的第一个被禁止的片段
 * 匹配不区分大小写，只要命令中包含该片段就会被拦截，
 * 因此 echo "pip install" 这样的命令也会被拦截。
 * @param command 完整的 shell 命令
 * @return 匹配到的片段，命令允许执行时返回空
 */
std::optional<std::string> find_blocked_pattern(const std::string &command);

bool is_command_allowed(const std::string &command);

/**
 * @brief 生成拦截命令时返回给调用者的 stderr 内容
 */
std::string blocked_command_message(const std::string &pattern);

}  // namespace vibe
