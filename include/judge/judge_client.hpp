#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include "scoring/absolute_score.hpp"

namespace vibe {

/**
 * @brief 工作区中的代码文件，键为相对路径
 */
using code_files = std::map<std::string, std::string>;

/**
 * @brief 对工作区代码给出 5 维度评分的评审
 * 实现需要支持在多个线程中同时调用 score
 */
class judge_client {
public:
    virtual ~judge_client() = default;

    /**
     * @brief 评审的唯一标识，一般为模型名
     */
    virtual std::string id() const = 0;

    /**
     * @brief 评审一组代码文件
     * @param spec 原始的任务描述
     * @param files 代码文件，为空时直接返回最低分
     * @param criteria 额外的评审标准
     * @throw network_error 请求失败
     */
    virtual absolute_score score(const std::string &spec,
                                 const code_files &files,
                                 const std::optional<std::string> &criteria) const = 0;
};

/**
 * @brief 收集工作区中的代码与文本文件
 * 按路径排序，最多 max_files 个，单个文件超过 100000 个字符时截断
 */
code_files collect_code_files(const std::filesystem::path &workspace, size_t max_files = 20);

/**
 * @brief 所有维度为 0 的评分，用于没有生成任何文件的工作区
 */
absolute_score empty_workspace_score();

/**
 * @brief 将代码文件拼接为提示词中的 Markdown 代码块
 */
std::string format_code_files(const code_files &files);

/**
 * @brief 构建评审提示词
 */
std::string build_judge_prompt(const std::string &spec, const code_files &files, const std::optional<std::string> &criteria);

/**
 * @brief 从回复中提取 JSON 文本
 * 优先使用 ``` 代码块中的内容，其次使用第一个 { 到最后一个 } 之间的内容，都没有时返回原文
 */
std::string extract_json(const std::string &text);

/**
 * @brief 将评审回复解析为评分
 * 回复无法解析时返回全 0 的评分，executes 的原因为 "Judge parsing error: ..."
 */
absolute_score parse_judge_reply(const std::string &reply, const judge_metrics &metrics);

}  // namespace vibe
