#pragma once

#include <filesystem>
#include <optional>

namespace vibe {

/**
 * @brief 查找 Python 入口文件
 * 优先级：main.py > app.py > index.py > run.py > server.py（任意深度）> 工作区根目录的第一个 .py 文件 > 第一个 .py 文件
 * @return 入口文件的绝对路径，没有 Python 文件时返回空
 */
std::optional<std::filesystem::path> find_python_entry(const std::filesystem::path &workspace);

/**
 * @brief 查找 HTML 入口文件
 * 优先级：index.html > main.html > app.html（任意深度）> 第一个 .html 文件
 * @return 入口文件的绝对路径，没有 HTML 文件时返回空
 */
std::optional<std::filesystem::path> find_html_entry(const std::filesystem::path &workspace);

}  // namespace vibe
