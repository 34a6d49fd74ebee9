#include "scoring/static_analyzer.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <cmath>
#include "analysis/source_analysis.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/stl_utils.hpp"
#include "common/utils.hpp"

namespace vibe {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

int static_report::quality_score() const {
    double score = 10;

    if (syntax_errors > 0)
        score -= min(5, syntax_errors * 2);
    if (docstring_coverage < 0.5)
        score -= 1;
    if (max_function_length > 100)
        score -= 1;
    else if (max_function_length > 50)
        score -= 0.5;
    if (!has_error_handling && files_analyzed > 0)
        score -= 0.5;
    if (console_logs > 5)
        score -= 1;
    if (todo_count > 3)
        score -= 0.5;
    if (long_lines > 10)
        score -= 0.5;

    // 与四舍六入五成双一致：8.5 得 8，9.5 得 10
    int rounded = (int)nearbyint(score);
    return max(0, min(10, rounded));
}

void to_json(json &j, const static_issue &issue) {
    j = {{"file", issue.file}, {"line", issue.line}, {"type", issue.type}, {"message", issue.message}};
}

void from_json(const json &j, static_issue &issue) {
    issue.file = get_value_def<string>(j, "", "file");
    issue.line = get_value_def<int>(j, 0, "line");
    issue.type = get_value<string>(j, "type");
    issue.message = get_value_def<string>(j, "", "message");
}

void to_json(json &j, const static_report &report) {
    vector<static_issue> issues(report.issues.begin(), report.issues.begin() + min<size_t>(20, report.issues.size()));
    j = {{"files_analyzed", report.files_analyzed},
         {"total_lines", report.total_lines},
         {"avg_function_length", round_to(report.avg_function_length, 1)},
         {"max_function_length", report.max_function_length},
         {"cyclomatic_complexity", round_to(report.cyclomatic_complexity, 1)},
         {"has_docstrings", report.has_docstrings},
         {"docstring_coverage", round_to(report.docstring_coverage, 2)},
         {"has_type_hints", report.has_type_hints},
         {"type_hint_coverage", round_to(report.type_hint_coverage, 2)},
         {"has_error_handling", report.has_error_handling},
         {"try_except_count", report.try_except_count},
         {"syntax_errors", report.syntax_errors},
         {"long_lines", report.long_lines},
         {"todo_count", report.todo_count},
         {"console_logs", report.console_logs},
         {"quality_score", report.quality_score()},
         {"issues", issues}};
}

void from_json(const json &j, static_report &report) {
    report.files_analyzed = get_value<int>(j, "files_analyzed");
    report.total_lines = get_value_def<int>(j, 0, "total_lines");
    report.avg_function_length = get_value_def<double>(j, 0, "avg_function_length");
    report.max_function_length = get_value_def<int>(j, 0, "max_function_length");
    report.cyclomatic_complexity = get_value_def<double>(j, 0, "cyclomatic_complexity");
    report.has_docstrings = get_value_def<bool>(j, false, "has_docstrings");
    report.docstring_coverage = get_value_def<double>(j, 0, "docstring_coverage");
    report.has_type_hints = get_value_def<bool>(j, false, "has_type_hints");
    report.type_hint_coverage = get_value_def<double>(j, 0, "type_hint_coverage");
    report.has_error_handling = get_value_def<bool>(j, false, "has_error_handling");
    report.try_except_count = get_value_def<int>(j, 0, "try_except_count");
    report.syntax_errors = get_value_def<int>(j, 0, "syntax_errors");
    report.long_lines = get_value_def<int>(j, 0, "long_lines");
    report.todo_count = get_value_def<int>(j, 0, "todo_count");
    report.console_logs = get_value_def<int>(j, 0, "console_logs");
    report.issues = get_value_def<vector<static_issue>>(j, {}, "issues");
}

/**
 * @brief 汇总所有文件的函数信息
 */
struct function_totals {
    int count = 0, total_length = 0, documented = 0, hinted = 0, complexity = 0;
};

static void merge(static_report &report, function_totals &totals, const string &name, const source_analysis &analysis) {
    report.total_lines += analysis.total_lines;
    append(report.issues, analysis.issues, [&](const source_issue &issue) {
        return static_issue{name, issue.line, issue.type, issue.message};
    });

    if (analysis.error) {
        ++report.syntax_errors;
        return;
    }

    report.long_lines += analysis.long_lines;
    report.todo_count += analysis.todo_count;
    report.console_logs += analysis.debug_output_count;
    report.try_except_count += analysis.try_count;
    report.has_error_handling |= analysis.has_error_handling;

    for (auto &func : analysis.functions) {
        ++totals.count;
        totals.total_length += func.length;
        if (func.has_docstring) ++totals.documented;
        if (func.has_type_hints) ++totals.hinted;
        report.max_function_length = max(report.max_function_length, func.length);
    }
}

static_report static_analyzer::analyze(const fs::path &workspace) const {
    static_report report;
    function_totals totals;
    bool has_python = false;

    vector<string> files;
    try {
        if (fs::is_directory(workspace)) files = list_files_recursive(workspace);
    } catch (const exception &e) {
        LOG(WARNING) << "Unable to list " << workspace << ": " << e.what();
        report.issues.push_back({"", 0, "analysis_error", e.what()});
    }

    // Python 文件先于 HTML 和 JavaScript 文件分析
    for (const char *extension : {".py", ".html", ".js"}) {
        for (auto &file : files) {
            if (fs::path(file).extension() != extension) continue;
            const source_adapter *adapter = adapter_for(file);
            string name = fs::path(file).filename().string();
            ++report.files_analyzed;

            try {
                source_analysis analysis = adapter->analyze(read_file_content(workspace / file), name);
                merge(report, totals, name, analysis);
                if (string(extension) == ".py" && !analysis.error) {
                    has_python = true;
                    totals.complexity += analysis.complexity;
                }
            } catch (const exception &e) {
                LOG(WARNING) << "Unable to analyze " << workspace / file << ": " << e.what();
                report.issues.push_back({name, 0, "analysis_error", e.what()});
            }
        }
    }

    if (totals.count > 0) {
        report.avg_function_length = (double)totals.total_length / totals.count;
        report.docstring_coverage = (double)totals.documented / totals.count;
        report.type_hint_coverage = (double)totals.hinted / totals.count;
        report.has_docstrings = totals.documented > 0;
        report.has_type_hints = totals.hinted > 0;
    }
    if (has_python)
        report.cyclomatic_complexity = (double)totals.complexity / max(1, totals.count);
    return report;
}

}  // namespace vibe
