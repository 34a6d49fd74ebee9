#include "testing/test_suite.hpp"
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace vibe {
using namespace std;

execution_result script_target::run(const string &args, const string &input, double timeout) const {
    string command = shell_quote(PYTHON_EXECUTABLE) + " " + shell_quote(entry_file.string());
    if (!args.empty()) command += " " + args;
    return run_command(command, workspace, timeout, MAX_OUTPUT_CHARS, input);
}

execution_result script_target::run_shell(const string &command, double timeout) const {
    return run_command(command, workspace, timeout);
}

test_suite &test_suite::add_page_test(const string &name, page_predicate predicate) {
    insert({name, move(predicate)});
    return *this;
}

test_suite &test_suite::add_script_test(const string &name, script_predicate predicate) {
    insert({name, move(predicate)});
    return *this;
}

void test_suite::insert(test_case test) {
    if (!boost::algorithm::starts_with(test.name, "test_"))
        throw invalid_argument("test name must start with test_: " + test.name);
    auto it = lower_bound(cases.begin(), cases.end(), test.name, [](const test_case &a, const string &name) {
        return a.name < name;
    });
    if (it != cases.end() && it->name == test.name)
        throw invalid_argument("duplicate test name: " + test.name);
    cases.insert(it, move(test));
}

const vector<test_case> &test_suite::tests() const {
    return cases;
}

bool test_suite::empty() const {
    return cases.empty();
}

size_t test_suite::size() const {
    return cases.size();
}

void expect(bool condition, const string &message) {
    if (!condition) throw assertion_failure(message);
}

}  // namespace vibe
