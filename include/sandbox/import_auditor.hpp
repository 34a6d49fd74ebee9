#pragma once

#include <set>
#include <string>
#include <vector>

namespace vibe {

/**
 * @brief 导入检查的结果
 */
struct import_audit {
    /**
     * @brief 所有导入的模块都在标准库白名单中
     */
    bool valid = true;

    /**
     * @brief 不在白名单中的顶层模块名，按字典序排序
     */
    std::vector<std::string> illegal;
};

/**
 * @brief Python 3.11 标准库模块白名单，包括少量常用的子包
 */
const std::set<std::string> &stdlib_modules();

bool is_stdlib_module(const std::string &name);

/**
 * @brief 检查一组已经提取出来的顶层模块名
 */
import_audit audit_imports(const std::set<std::string> &imports);

/**
 * @brief 解析 Python 源代码并检查其导入的模块
 * @param source Python 源代码
 * @param filename 文件名，用于错误信息
 * @throw syntax_error 源代码无法解析
 */
import_audit audit_source(const std::string &source, const std::string &filename = "<unknown>");

}  // namespace vibe
