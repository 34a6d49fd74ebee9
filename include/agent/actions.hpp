#pragma once

#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <variant>
#include <vector>
#include "sandbox/executor.hpp"

namespace vibe {

struct write_file_action {
    std::string path;
    std::string content;
};

struct run_command_action {
    std::string command;
};

struct done_action {
    std::string summary;
};

using agent_action = std::variant<write_file_action, run_command_action, done_action>;

/**
 * @brief 代理会话的统计信息，用于计算效率分
 */
struct agent_metrics {
    int turns = 0;
    int errors_encountered = 0;

    /**
     * @brief 重写之前轮次已写过的文件的轮数
     */
    int backtrack_count = 0;

    /**
     * @brief 没有任何动作的轮数
     */
    int planning_turns = 0;

    int files_written = 0;
    int commands_run = 0;

    /**
     * @brief 之前轮次写过的文件，不参与序列化
     */
    std::set<std::string> written_paths;
};

void to_json(nlohmann::json &j, const agent_metrics &metrics);
void from_json(const nlohmann::json &j, agent_metrics &metrics);

/**
 * @brief 按出现顺序解析回复中的动作标签
 * 支持 <write_file path="...">...</write_file>, <run_command>...</run_command>, <done>...</done> 与 <done/>
 */
std::vector<agent_action> parse_actions(const std::string &response);

/**
 * @brief 一轮动作的执行结果
 */
struct turn_outcome {
    std::vector<std::string> feedback;
    bool done = false;
};

/**
 * @brief 在沙箱中按顺序执行一轮动作，done 在其他动作都执行完后才生效
 * 命令经过沙箱执行，因此同样受包管理器拦截的限制
 */
turn_outcome apply_actions(const sandbox_executor &executor,
                           const std::vector<agent_action> &actions,
                           agent_metrics &metrics);

}  // namespace vibe
