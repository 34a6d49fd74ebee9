#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace vibe {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将文本写入文件，会自动创建父文件夹
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 计算 UTF-8 文本的字符数（而不是字节数）
 */
size_t utf8_length(const std::string &string);

/**
 * @brief 将非法的 UTF-8 字节替换为 '?'
 * 被评测程序的输出不一定是合法的 UTF-8，而 JSON 序列化要求合法的 UTF-8
 */
std::string utf8_sanitize(const std::string &string);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保写入工作区的文件不会跳出工作区，
 * 模型生成的文件名可能包含 "../" 或者绝对路径。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 递归列出文件夹内的所有普通文件
 * 跳过隐藏目录以及 __pycache__、node_modules、venv
 * @param dir 要被列出的文件夹
 * @return 相对于 dir 的路径，按字典序排序；dir 不存在时返回空列表
 * @throw std::filesystem::filesystem_error 遍历目录时出错
 */
std::vector<std::string> list_files_recursive(const std::filesystem::path &dir);

/**
 * @brief 按行切分文本，与 Python 的 str.split('\n') 行为一致，空文本返回一行
 */
std::vector<std::string> split_lines(const std::string &content);

}  // namespace vibe
