#include "scoring/auto_scorer.hpp"
#include <glog/logging.h>
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "sandbox/validator.hpp"

namespace vibe {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

double auto_score::test_score() const {
    return test_pass_rate * 10;
}

int auto_score::execution_score() const {
    if (!execution_success) return 0;
    if (tests_total == 0) return 5;
    return test_pass_rate > 0.5 ? 10 : 7;
}

void to_json(json &j, const auto_score &score) {
    json details = json::array();
    for (size_t i = 0; i < score.test_details.size() && i < 10; ++i) {
        auto &detail = score.test_details[i];
        details.push_back({{"name", detail.name},
                           {"passed", detail.passed},
                           {"error", detail.error ? json(*detail.error) : json()}});
    }
    j = {{"test_pass_rate", round_to(score.test_pass_rate, 3)},
         {"tests_passed", score.tests_passed},
         {"tests_failed", score.tests_failed},
         {"tests_total", score.tests_total},
         {"test_score", score.test_score()},
         {"execution_success", score.execution_success},
         {"execution_score", score.execution_score()},
         {"test_details", details}};
}

void from_json(const json &j, auto_score &score) {
    score.test_pass_rate = get_value<double>(j, "test_pass_rate");
    score.tests_passed = get_value<int>(j, "tests_passed");
    score.tests_failed = get_value<int>(j, "tests_failed");
    score.tests_total = get_value<int>(j, "tests_total");
    score.execution_success = get_value<bool>(j, "execution_success");
    score.test_details = get_value_def<vector<test_result>>(j, {}, "test_details");
}

auto_scorer::auto_scorer(browser_pool &pool, suite_registry registry, double timeout, double fallback_timeout)
    : pool(pool), registry(move(registry)), runner(pool, timeout), fallback_timeout(fallback_timeout) {}

auto_score auto_scorer::execution_only(const fs::path &workspace) const {
    execution_validator validator(pool, fallback_timeout, false);
    auto_score score;
    score.execution_success = validator.validate(workspace).executed;
    return score;
}

auto_score auto_scorer::score(const fs::path &workspace, const optional<fs::path> &case_dir) const {
    if (!case_dir) return execution_only(workspace);

    optional<test_suite> suite;
    try {
        suite = resolve_suite(*case_dir, registry);
    } catch (const exception &e) {
        LOG(WARNING) << "Ignoring malformed test source in " << *case_dir << ": " << e.what();
    }
    if (!suite) return execution_only(workspace);
    return score(workspace, *suite);
}

auto_score auto_scorer::score(const fs::path &workspace, const test_suite &suite) const {
    test_run_result summary = runner.run(workspace, suite);
    auto_score score;
    score.test_pass_rate = summary.pass_rate;
    score.tests_passed = summary.passed;
    score.tests_failed = summary.failed;
    score.tests_total = summary.total;
    score.execution_success = summary.passed > 0 || summary.total == 0;
    score.test_details = summary.results;
    return score;
}

}  // namespace vibe
