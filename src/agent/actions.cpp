#include "agent/actions.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <regex>
#include "common/json_utils.hpp"
#include "common/stl_utils.hpp"

namespace vibe {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const agent_metrics &metrics) {
    j = {{"turns", metrics.turns},
         {"errors_encountered", metrics.errors_encountered},
         {"backtrack_count", metrics.backtrack_count},
         {"planning_turns", metrics.planning_turns},
         {"files_written", metrics.files_written},
         {"commands_run", metrics.commands_run}};
}

void from_json(const json &j, agent_metrics &metrics) {
    metrics.turns = get_value_def<int>(j, 1, "turns");
    metrics.errors_encountered = get_value_def<int>(j, 0, "errors_encountered");
    metrics.backtrack_count = get_value_def<int>(j, 0, "backtrack_count");
    metrics.planning_turns = get_value_def<int>(j, 0, "planning_turns");
    metrics.files_written = get_value_def<int>(j, 0, "files_written");
    metrics.commands_run = get_value_def<int>(j, 0, "commands_run");
}

vector<agent_action> parse_actions(const string &response) {
    static const regex tag(
        R"re(<write_file\s+path="([^"]+)">([\s\S]*?)</write_file>)re"
        R"(|<run_command>([\s\S]*?)</run_command>)"
        R"(|<done>([\s\S]*?)</done>)"
        R"(|<done\s*/>)");

    vector<agent_action> actions;
    for (sregex_iterator it(response.begin(), response.end(), tag), end; it != end; ++it) {
        auto &match = *it;
        if (match[1].matched) {
            actions.push_back(write_file_action{match[1].str(), boost::algorithm::trim_copy(match[2].str())});
        } else if (match[3].matched) {
            string command = boost::algorithm::trim_copy(match[3].str());
            if (!command.empty()) actions.push_back(run_command_action{command});
        } else if (match[4].matched) {
            actions.push_back(done_action{boost::algorithm::trim_copy(match[4].str())});
        } else {
            actions.push_back(done_action{});
        }
    }
    return actions;
}

turn_outcome apply_actions(const sandbox_executor &executor, const vector<agent_action> &actions, agent_metrics &metrics) {
    turn_outcome outcome;
    set<string> written;
    bool acted = false;
    ++metrics.turns;

    for (auto &action : actions) {
        visit(overloaded{
                  [&](const write_file_action &write) {
                      acted = true;
                      try {
                          executor.write_file(write.path, write.content);
                          ++metrics.files_written;
                          written.insert(write.path);
                          outcome.feedback.push_back("Wrote " + write.path);
                      } catch (const exception &e) {
                          ++metrics.errors_encountered;
                          outcome.feedback.push_back(fmt::format("Failed to write {}: {}", write.path, e.what()));
                      }
                  },
                  [&](const run_command_action &run) {
                      acted = true;
                      execution_result result = executor.run(run.command);
                      ++metrics.commands_run;
                      if (!result.success) ++metrics.errors_encountered;

                      string feedback = fmt::format("{} Command: {}\nExit code: {}",
                                                    result.success ? "OK" : "FAILED", run.command, result.return_code);
                      if (!result.stdout_text.empty()) feedback += "\nSTDOUT:\n" + result.stdout_text;
                      if (!result.stderr_text.empty()) feedback += "\nSTDERR:\n" + result.stderr_text;
                      outcome.feedback.push_back(feedback);
                  },
                  [&](const done_action &) { outcome.done = true; }},
              action);
    }

    for (auto &path : written) {
        if (metrics.written_paths.count(path)) {
            ++metrics.backtrack_count;
            break;
        }
    }
    metrics.written_paths.insert(written.begin(), written.end());

    if (!acted && !outcome.done) {
        ++metrics.planning_turns;
        outcome.feedback.push_back("No actions detected. Please write files, run commands, or signal <done> when complete.");
    }
    return outcome;
}

}  // namespace vibe
