#include "testing/suite_registry.hpp"
#include <stdlib.h>
#include <cerrno>
#include <cstring>
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <system_error>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "testing/suite_loader.hpp"

namespace vibe {
using namespace std;
namespace fs = std::filesystem;

suite_registry &suite_registry::add(const string &case_name, suite_factory factory) {
    factories[case_name] = move(factory);
    return *this;
}

optional<test_suite> suite_registry::find(const string &case_name) const {
    auto it = factories.find(case_name);
    if (it == factories.end()) return nullopt;
    return it->second();
}

bool suite_registry::contains(const string &case_name) const {
    return factories.count(case_name) > 0;
}

vector<string> suite_registry::names() const {
    vector<string> result;
    for (auto &[name, factory] : factories) result.push_back(name);
    return result;
}

suite_registry suite_registry::with_builtin_suites() {
    suite_registry registry;
    registry.add("case_03_calculator", calculator_suite);
    registry.add("case_16_repostats", repostats_suite);
    return registry;
}

optional<test_suite> resolve_suite(const fs::path &case_dir, const suite_registry &registry) {
    fs::path source = case_dir / "tests.json";
    if (fs::is_regular_file(source)) return load_suite_file(source);
    return registry.find(case_dir.filename().string());
}

static void clear_calculator(browser_page &page) {
    for (const char *label : {"AC", "Clear", "C"}) {
        if (page.count("button", label) > 0) {
            page.click("button", label);
            page.wait_for_timeout(100);
            return;
        }
    }
}

static void click_any(browser_page &page, initializer_list<const char *> labels) {
    for (const char *label : labels) {
        if (page.count("button", label) > 0) {
            page.click("button", label);
            return;
        }
    }
    throw assertion_failure(fmt::format("No button for {}", *labels.begin()));
}

static void expect_display(browser_page &page, const string &expected) {
    page.wait_for_timeout(200);
    string content = page.text_content("body");
    expect(content.find(expected) != string::npos,
           fmt::format("Expected {} in display, got: {}", expected, truncate_text(content, 100, "")));
}

static page_predicate arithmetic(char lhs, initializer_list<const char *> ops, char rhs, string expected, bool clear) {
    vector<const char *> labels(ops);
    return [=](browser_page &page) {
        if (clear) clear_calculator(page);
        page.click("button", string(1, lhs));
        bool clicked = false;
        for (const char *label : labels) {
            if (page.count("button", label) > 0) {
                page.click("button", label);
                clicked = true;
                break;
            }
        }
        expect(clicked, fmt::format("No button for {}", labels.front()));
        page.click("button", string(1, rhs));
        click_any(page, {"="});
        expect_display(page, expected);
    };
}

test_suite calculator_suite() {
    test_suite suite;
    suite.add_page_test("test_has_number_buttons", [](browser_page &page) {
        for (int digit = 0; digit < 10; ++digit) {
            string label = to_string(digit);
            expect(page.count("button, [class*='btn']", label) > 0, "No button for digit " + label);
        }
    });
    suite.add_page_test("test_has_operation_buttons", [](browser_page &page) {
        int found = 0;
        for (const char *op : {"+", "-", "×", "÷", "*", "/"})
            if (page.count("button", op) > 0) ++found;
        expect(found >= 4, fmt::format("Missing operation buttons, found {}", found));
    });
    suite.add_page_test("test_has_equals_button", [](browser_page &page) {
        expect(page.count("button", "=") + page.count("button", "Enter") > 0, "No equals button found");
    });
    suite.add_page_test("test_has_clear_button", [](browser_page &page) {
        int found = 0;
        for (const char *label : {"C", "AC", "Clear", "CLR"}) found += page.count("button", label);
        expect(found > 0, "No clear button found");
    });
    suite.add_page_test("test_has_decimal_button", [](browser_page &page) {
        expect(page.count("button", ".") + page.count("button", ",") > 0, "No decimal button found");
    });
    suite.add_page_test("test_basic_addition", arithmetic('7', {"+"}, '3', "10", false));
    suite.add_page_test("test_basic_subtraction", arithmetic('9', {"-", "−"}, '4', "5", true));
    suite.add_page_test("test_basic_multiplication", arithmetic('6', {"×", "*"}, '7', "42", true));
    suite.add_page_test("test_basic_division", arithmetic('8', {"÷", "/"}, '2', "4", true));
    suite.add_page_test("test_clear_resets_display", [](browser_page &page) {
        page.click("button", "5");
        page.click("button", "5");
        click_any(page, {"AC", "Clear", "C"});
        page.wait_for_timeout(200);
        expect(page.text_content("body").find("55") == string::npos, "Clear did not reset display");
    });
    suite.add_page_test("test_no_console_errors", [](browser_page &page) {
        page.clear_errors();
        page.reload(PAGE_LOAD_TIMEOUT);
        page.wait_for_timeout(500);
        auto errors = page.errors();
        expect(errors.empty(), "Page has JS errors: " + boost::algorithm::join(errors, "; "));
    });
    return suite;
}

/**
 * @brief 建立一个只有一次提交的临时 git 仓库，离开作用域时删除
 */
struct scratch_repository {
    fs::path dir;

    scratch_repository(const script_target &target, const string &file, const string &content) {
        string pattern = (fs::temp_directory_path() / "vibe-repo-XXXXXX").string();
        if (!mkdtemp(pattern.data()))
            throw internal_error("Unable to create temporary repository: ") << strerror(errno);
        dir = pattern;
        write_file_content(dir / file, content);
        string q = shell_quote(dir.string());
        auto result = target.run_shell(fmt::format(
            "git init -q {0} && git -C {0} config user.email test@test.com && git -C {0} config user.name Test"
            " && git -C {0} add . && git -C {0} commit -q -m test",
            q));
        if (result.return_code != 0) {
            error_code ec;
            fs::remove_all(dir, ec);
            throw internal_error("Unable to prepare git repository: " + result.stderr_text);
        }
    }

    ~scratch_repository() {
        error_code ec;
        fs::remove_all(dir, ec);
    }
};

static string lower_source(const script_target &target) {
    return boost::algorithm::to_lower_copy(read_file_content(target.entry_file));
}

static bool contains_any(const string &content, initializer_list<const char *> terms) {
    for (const char *term : terms)
        if (content.find(term) != string::npos) return true;
    return false;
}

test_suite repostats_suite() {
    test_suite suite;
    suite.add_script_test("test_script_exists", [](const script_target &target) {
        bool found = false;
        for (auto &entry : fs::directory_iterator(target.workspace))
            if (entry.is_regular_file() && entry.path().extension() == ".py") found = true;
        expect(found, "No Python script found");
    });
    suite.add_script_test("test_no_syntax_errors", [](const script_target &target) {
        auto result = target.run_shell(shell_quote(PYTHON_EXECUTABLE) + " -m py_compile " +
                                       shell_quote(target.entry_file.string()), 10);
        expect(result.return_code == 0, "Syntax error: " + result.stderr_text);
    });
    suite.add_script_test("test_script_runs", [](const script_target &target) {
        scratch_repository repo(target, "test.txt", "hello");
        auto result = target.run(shell_quote(repo.dir.string()));
        expect(result.return_code == 0 || !result.stdout_text.empty(), "Script failed: " + result.stderr_text);
    });
    suite.add_script_test("test_produces_html", [](const script_target &target) {
        scratch_repository repo(target, "test.py", "print('hello')");
        auto result = target.run(shell_quote(repo.dir.string()));
        string output = boost::algorithm::to_lower_copy(result.stdout_text);
        bool has_html = contains_any(output, {"<html", "<!doctype", "<div"});
        for (auto &dir : {target.workspace, repo.dir})
            for (auto &entry : fs::directory_iterator(dir))
                if (entry.path().extension() == ".html") has_html = true;
        expect(has_html, "No HTML output produced");
    });
    suite.add_script_test("test_uses_stdlib_only", [](const script_target &target) {
        string content = read_file_content(target.entry_file);
        vector<string> violations;
        for (const char *term : {"import requests", "import pandas", "import numpy", "from bs4"})
            if (content.find(term) != string::npos) violations.push_back(term);
        expect(violations.empty(), "Uses external libraries: " + boost::algorithm::join(violations, ", "));
    });
    suite.add_script_test("test_has_git_commands", [](const script_target &target) {
        expect(contains_any(lower_source(target), {"git log", "git show", "git diff", "subprocess", "os.popen"}),
               "No git commands found");
    });
    suite.add_script_test("test_includes_commit_count", [](const script_target &target) {
        expect(contains_any(lower_source(target), {"commit", "commits", "total", "count"}),
               "No commit counting logic");
    });
    suite.add_script_test("test_includes_author_stats", [](const script_target &target) {
        expect(contains_any(lower_source(target), {"author", "contributor", "user", "name"}),
               "No author stats logic");
    });
    return suite;
}

}  // namespace vibe
