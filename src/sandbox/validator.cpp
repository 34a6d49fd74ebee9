#include "sandbox/validator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include "analysis/source_analysis.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "sandbox/entry_point.hpp"
#include "sandbox/executor.hpp"
#include "sandbox/import_auditor.hpp"

namespace vibe {
using namespace std;
namespace fs = std::filesystem;

execution_validator::execution_validator(browser_pool &pool, double timeout, bool capture_screenshot)
    : pool(pool), timeout(timeout), capture_screenshot(capture_screenshot) {}

execution_report execution_validator::validate(const fs::path &workspace) const {
    file_type type = file_type::NONE;
    try {
        if (auto entry = find_python_entry(workspace)) {
            type = file_type::PYTHON;
            return validate_python(*entry, workspace);
        }
        if (auto entry = find_html_entry(workspace)) {
            type = file_type::HTML;
            return validate_html(*entry);
        }
    } catch (const exception &e) {
        LOG(ERROR) << "Failed to validate workspace " << workspace << ": " << e.what();
        execution_report report;
        report.type = type;
        report.exit_code = -1;
        report.errors.push_back(fmt::format("Execution error: {}", e.what()));
        return report;
    }

    execution_report report;
    report.errors.push_back("No Python or HTML files found to validate");
    report.type = file_type::NONE;
    return report;
}

// 从 stderr 中提取 "ModuleNotFoundError: No module named 'x'" 的说明部分
static string missing_module_detail(const string &stderr_text) {
    static const string marker = "ModuleNotFoundError:";
    size_t pos = stderr_text.find(marker);
    if (pos == string::npos) return "ModuleNotFoundError";
    string rest = stderr_text.substr(pos + marker.length());
    return boost::algorithm::trim_copy(rest.substr(0, rest.find('\n')));
}

execution_report execution_validator::validate_python(const fs::path &file, const fs::path &workspace) const {
    execution_report report;
    report.type = file_type::PYTHON;

    string source = read_file_content(file);
    python_source_adapter adapter;
    source_analysis analysis = adapter.analyze(source, file.filename().string());
    if (analysis.error) {
        report.errors.push_back("Syntax error: " + analysis.error->description);
        return report;
    }

    import_audit audit = audit_imports(analysis.imports);
    report.illegal_imports = audit.illegal;
    if (!audit.valid)
        report.errors.push_back("Illegal imports detected: " + boost::algorithm::join(audit.illegal, ", "));

    string command = shell_quote(PYTHON_EXECUTABLE) + " " + shell_quote(file.string());
    execution_result result = run_command(command, workspace, timeout);
    report.execution_time = result.execution_time;

    if (result.timed_out) {
        report.exit_code = -1;
        report.stdout_text = result.stdout_text;
        report.errors.push_back(fmt::format("Execution timed out after {:g}s", timeout));
        return report;
    }

    report.exit_code = result.return_code;
    report.stdout_text = result.stdout_text;
    report.stderr_text = result.stderr_text;

    bool missing_module = result.stderr_text.find("ModuleNotFoundError") != string::npos;
    if (missing_module)
        report.errors.push_back("Missing module: " + missing_module_detail(result.stderr_text));
    else if (result.return_code != 0)
        report.errors.push_back(fmt::format("Exited with code {}", result.return_code));

    report.executed = result.return_code == 0 && audit.valid && !missing_module;
    return report;
}

execution_report execution_validator::validate_html(const fs::path &file) const {
    execution_report report;
    report.type = file_type::HTML;

    if (!fs::exists(file)) {
        report.errors.push_back("File not found: " + file.string());
        return report;
    }

    elapsed_time timer;
    unique_ptr<browser_page> page;
    try {
        page = pool.acquire_page();
        if (!page) return validate_html_structure(file);

        page->navigate(file_url(file), PAGE_LOAD_TIMEOUT);
        page->wait_for_timeout(PAGE_SETTLE_TIME);
        if (capture_screenshot)
            report.screenshot = page->screenshot();
    } catch (const browser_error &e) {
        report.execution_time = timer.seconds();
        report.exit_code = -1;
        if (page) report.errors = page->errors();
        report.errors.push_back(fmt::format("Browser validation error: {}", e.what()));
        return report;
    }

    report.errors = page->errors();
    page->close();

    report.execution_time = timer.seconds();
    report.executed = report.errors.empty();
    report.exit_code = report.executed ? 0 : 1;
    return report;
}

execution_report execution_validator::validate_html_structure(const fs::path &file) {
    execution_report report;
    report.type = file_type::HTML;

    string content = boost::algorithm::to_lower_copy(read_file_content(file));
    if (content.find("<html") == string::npos)
        report.errors.push_back("Missing <html> tag");
    if (content.find("<body") == string::npos)
        report.errors.push_back("Missing <body> tag");

    report.executed = report.errors.empty();
    report.exit_code = report.executed ? 0 : 1;
    report.stderr_text = "Note: headless browser not available - basic validation only";
    return report;
}

}  // namespace vibe
