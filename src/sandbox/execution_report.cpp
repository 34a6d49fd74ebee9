#include "sandbox/execution_report.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"

namespace vibe {
using namespace std;
using namespace nlohmann;

// clang-format off
static const unordered_map<file_type, const char *> file_type_string = boost::assign::map_list_of
    (file_type::PYTHON, "python")
    (file_type::HTML, "html")
    (file_type::NONE, "none");
// clang-format on

const char *get_display_message(file_type type) {
    return file_type_string.at(type);
}

file_type parse_file_type(const string &type) {
    for (auto &[key, value] : file_type_string)
        if (type == value) return key;
    throw invalid_argument("unknown file type " + type);
}

static string clip(const string &text) {
    return utf8_sanitize(text.substr(0, REPORT_OUTPUT_CHARS));
}

void to_json(json &j, const execution_report &report) {
    j = {{"executed", report.executed},
         {"exit_code", report.exit_code},
         {"stdout", clip(report.stdout_text)},
         {"stderr", clip(report.stderr_text)},
         {"execution_time", report.execution_time},
         {"errors", report.errors},
         {"illegal_imports", report.illegal_imports},
         {"file_type", get_display_message(report.type)}};
}

void from_json(const json &j, execution_report &report) {
    report.executed = get_value<bool>(j, "executed");
    report.exit_code = get_value_def<int>(j, 0, "exit_code");
    report.stdout_text = get_value_def<string>(j, "", "stdout");
    report.stderr_text = get_value_def<string>(j, "", "stderr");
    report.execution_time = get_value_def<double>(j, 0, "execution_time");
    report.errors = get_value_def<vector<string>>(j, {}, "errors");
    report.illegal_imports = get_value_def<vector<string>>(j, {}, "illegal_imports");
    report.type = parse_file_type(get_value_def<string>(j, "none", "file_type"));
}

}  // namespace vibe
