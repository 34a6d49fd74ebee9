#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace vibe {

/**
 * @brief 一个函数定义的静态信息
 */
struct function_info {
    std::string name;

    /**
     * @brief 函数定义所在的行号，从 1 开始
     */
    int line = 0;

    /**
     * @brief 函数定义占据的行数，包括函数签名和函数体
     */
    int length = 0;

    bool has_docstring = false;

    /**
     * @brief 返回值或者任一位置参数带有类型注解
     */
    bool has_type_hints = false;
};

/**
 * @brief 源代码无法解析时的错误信息
 */
struct parse_error {
    /**
     * @brief 出错的行号，未知时为 0
     */
    int line = 0;

    /**
     * @brief 简短的错误描述，例如 "invalid syntax"
     */
    std::string message;

    /**
     * @brief 完整的错误描述，包含文件名和行号
     */
    std::string description;
};

/**
 * @brief 源代码中发现的问题
 */
struct source_issue {
    int line = 0;

    /**
     * @brief 问题类型：syntax_error, warning, analysis_error
     */
    std::string type;

    std::string message;
};

/**
 * @brief 一个源文件的静态分析结果
 * 由具体语言的 source_adapter 生成，静态分析器与执行验证器只依赖这里的字段。
 */
struct source_analysis {
    /**
     * @brief 源代码无法解析时非空，此时语法树相关的字段都为空
     */
    std::optional<parse_error> error;

    /**
     * @brief 导入的顶层模块名，例如 import os.path 记录为 os
     */
    std::set<std::string> imports;

    std::vector<function_info> functions;

    /**
     * @brief try 语句的数量
     */
    int try_count = 0;

    bool has_error_handling = false;

    /**
     * @brief 简化的圈复杂度：1 加上所有分支节点的数量
     */
    int complexity = 1;

    int total_lines = 0;

    /**
     * @brief 超过 120 个字符的行数
     */
    int long_lines = 0;

    int todo_count = 0;

    /**
     * @brief 调试输出的数量，Python 为 print，JavaScript 为 console.*
     */
    int debug_output_count = 0;

    std::vector<source_issue> issues;
};

/**
 * @brief 针对一种语言的源代码分析器
 */
class source_adapter {
public:
    virtual ~source_adapter() = default;

    /**
     * @brief 分析一个源文件
     * 语法错误记录在返回值的 error 字段中，不会抛出异常
     * @param source 源代码内容
     * @param filename 文件名，用于错误信息
     */
    virtual source_analysis analyze(const std::string &source, const std::string &filename) const = 0;
};

/**
 * @brief 通过嵌入式 Python 解释器的 ast 模块分析 Python 源代码
 * 调用前必须已经初始化解释器，调用线程不能持有 GIL
 */
class python_source_adapter : public source_adapter {
public:
    source_analysis analyze(const std::string &source, const std::string &filename) const override;
};

/**
 * @brief 分析 HTML 与 JavaScript 源代码
 * 只做逐行扫描，不建立函数模型
 */
class script_source_adapter : public source_adapter {
public:
    source_analysis analyze(const std::string &source, const std::string &filename) const override;
};

/**
 * @brief 根据文件扩展名选择分析器
 * @return .py 返回 Python 分析器，.html/.js 返回脚本分析器，其他返回 nullptr
 */
const source_adapter *adapter_for(const std::string &filename);

}  // namespace vibe
