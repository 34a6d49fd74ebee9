#include "judge/multi_judge.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>
#include <numeric>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace vibe {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

// clang-format off
static const unordered_map<aggregation_mode, const char *> aggregation_mode_string = boost::assign::map_list_of
    (aggregation_mode::AVERAGE, "average")
    (aggregation_mode::MEDIAN, "median")
    (aggregation_mode::CONSENSUS, "consensus");
// clang-format on

const char *get_display_message(aggregation_mode mode) {
    return aggregation_mode_string.at(mode);
}

aggregation_mode parse_aggregation_mode(const string &mode) {
    for (auto &[key, value] : aggregation_mode_string)
        if (mode == value) return key;
    throw invalid_argument("unknown aggregation mode " + mode);
}

long multi_judge_score::total_judge_tokens() const {
    long total = 0;
    for (auto &[id, score] : individual_scores)
        if (score.metrics) total += score.metrics->total_tokens();
    return total;
}

double multi_judge_score::total_judge_cost() const {
    double total = 0;
    for (auto &[id, score] : individual_scores)
        if (score.metrics) total += score.metrics->estimated_cost();
    return round_to(total, 6);
}

absolute_score multi_judge_score::as_absolute_score() const {
    if (aggregated_dimensions.empty())
        return absolute_score::zero("No judge scores available", "No judge scores available");

    absolute_score result;
    string reason = fmt::format("Aggregated from {} judges ({})", judges_used.size(), get_display_message(mode));
    for (auto &name : absolute_score::dimension_names()) {
        auto it = aggregated_dimensions.find(name);
        int value = it == aggregated_dimensions.end() ? 0 : (int)lround(it->second);
        result.dimension(name) = {max(0, min(10, value)), reason};
    }
    return result;
}

void to_json(json &j, const multi_judge_score &score) {
    json individual = json::object();
    for (auto &[id, judge_score] : score.individual_scores)
        individual[id] = judge_score;
    j = {{"individual_scores", individual},
         {"final_score", score.final_score},
         {"aggregated_dimensions", score.aggregated_dimensions},
         {"disagreement_flag", score.disagreement_flag},
         {"spread", score.spread},
         {"judges_used", score.judges_used},
         {"aggregation_mode", get_display_message(score.mode)},
         {"dimension_spreads", score.dimension_spreads},
         {"total_judge_tokens", score.total_judge_tokens()},
         {"total_judge_cost", score.total_judge_cost()}};
}

void from_json(const json &j, multi_judge_score &score) {
    score.individual_scores.clear();
    if (exists(j, "individual_scores"))
        for (auto &[id, value] : j.at("individual_scores").items())
            score.individual_scores[id] = value.get<absolute_score>();
    score.final_score = get_value<double>(j, "final_score");
    score.aggregated_dimensions = get_value_def<map<string, double>>(j, {}, "aggregated_dimensions");
    score.disagreement_flag = get_value<bool>(j, "disagreement_flag");
    score.spread = get_value_def<double>(j, 0, "spread");
    score.judges_used = get_value_def<vector<string>>(j, {}, "judges_used");
    score.mode = parse_aggregation_mode(get_value_def<string>(j, "median", "aggregation_mode"));
    score.dimension_spreads = get_value_def<map<string, double>>(j, {}, "dimension_spreads");
}

static double aggregate(vector<double> values, aggregation_mode mode) {
    if (mode == aggregation_mode::AVERAGE)
        return accumulate(values.begin(), values.end(), 0.0) / values.size();

    sort(values.begin(), values.end());
    size_t n = values.size();
    return n % 2 ? values[n / 2] : (values[n / 2 - 1] + values[n / 2]) / 2;
}

static double spread_of(const vector<double> &values) {
    if (values.size() < 2) return 0;
    auto [lo, hi] = minmax_element(values.begin(), values.end());
    return *hi - *lo;
}

multi_judge_score aggregate_scores(const vector<pair<string, absolute_score>> &scores,
                                   aggregation_mode mode,
                                   double threshold) {
    multi_judge_score result;
    result.mode = mode;
    if (scores.empty()) {
        result.disagreement_flag = true;
        return result;
    }

    vector<double> totals;
    for (auto &[id, score] : scores) {
        result.individual_scores[id] = score;
        result.judges_used.push_back(id);
        totals.push_back(score.total_score());
    }

    result.final_score = round_to(aggregate(totals, mode), 1);
    result.spread = round_to(spread_of(totals), 1);
    result.disagreement_flag = result.spread > threshold;

    for (auto &name : absolute_score::dimension_names()) {
        vector<double> values;
        for (auto &[id, score] : scores) values.push_back(score.dimension(name).score);
        result.aggregated_dimensions[name] = round_to(aggregate(values, mode), 1);
        result.dimension_spreads[name] = spread_of(values);
    }
    return result;
}

vector<judge_config> default_judges() {
    vector<judge_config> judges;
    for (const char *model : {"anthropic/claude-opus-4.5", "openai/gpt-4o", "google/gemini-3-flash-preview"}) {
        judge_config config;
        config.id = config.model = model;
        judges.push_back(config);
    }
    return judges;
}

void from_json(const json &j, arbitration_config &config) {
    config.mode = parse_aggregation_mode(get_value_def<string>(j, "median", "mode"));
    config.threshold = get_value_def<double>(j, DISAGREEMENT_THRESHOLD, "threshold");
    config.judges.clear();
    if (!exists(j, "judges")) return;
    for (auto &entry : j.at("judges")) {
        judge_config judge;
        if (entry.is_string())
            judge.id = judge.model = entry.get<string>();
        else
            judge = entry.get<judge_config>();
        config.judges.push_back(judge);
    }
}

multi_judge_arbitrator::multi_judge_arbitrator(vector<pair<shared_ptr<const judge_client>, double>> judges,
                                               aggregation_mode mode,
                                               double threshold)
    : judges(move(judges)), aggregation(mode), threshold(threshold) {}

multi_judge_arbitrator::multi_judge_arbitrator(const arbitration_config &config)
    : aggregation(config.mode), threshold(config.threshold) {
    for (auto &judge : config.judges.empty() ? default_judges() : config.judges)
        judges.emplace_back(make_shared<http_judge_client>(judge), judge.timeout);
}

multi_judge_arbitrator::~multi_judge_arbitrator() {
    reap_workers(true);
}

void multi_judge_arbitrator::reap_workers(bool wait) const {
    lock_guard<mutex> lock(workers_mutex);
    auto it = workers.begin();
    while (it != workers.end()) {
        if (wait || *it->finished) {
            it->thread.join();
            it = workers.erase(it);
        } else {
            ++it;
        }
    }
}

aggregation_mode multi_judge_arbitrator::mode() const {
    return aggregation;
}

size_t multi_judge_arbitrator::size() const {
    return judges.size();
}

multi_judge_score multi_judge_arbitrator::score(const string &spec,
                                                const fs::path &workspace,
                                                const optional<string> &criteria) const {
    return score(spec, collect_code_files(workspace), criteria);
}

multi_judge_score multi_judge_arbitrator::score(const string &spec,
                                                const code_files &files,
                                                const optional<string> &criteria) const {
    using clock = chrono::steady_clock;
    auto start = clock::now();

    reap_workers(false);

    // 超时评审的线程可能比本次调用活得更久，因此参数按值捕获
    vector<future<absolute_score>> pending;
    for (auto &entry : judges) {
        auto result = make_shared<promise<absolute_score>>();
        auto finished = make_shared<atomic<bool>>(false);
        pending.push_back(result->get_future());
        thread runner([judge = entry.first, result, finished, spec, files, criteria] {
            try {
                result->set_value(judge->score(spec, files, criteria));
            } catch (...) {
                result->set_exception(current_exception());
            }
            *finished = true;
        });
        lock_guard<mutex> lock(workers_mutex);
        workers.push_back({move(runner), finished});
    }

    vector<pair<string, absolute_score>> scores;
    for (size_t i = 0; i < judges.size(); ++i) {
        auto &[judge, timeout] = judges[i];
        string id = judge->id();
        auto deadline = start + chrono::duration_cast<clock::duration>(chrono::duration<double>(timeout));

        if (pending[i].wait_until(deadline) != future_status::ready) {
            LOG(WARNING) << "Judge " << id << " timed out after " << timeout << "s";
            scores.emplace_back(id, absolute_score::zero(fmt::format("Judge timed out after {:g}s", timeout), "Judge failed"));
            continue;
        }
        try {
            scores.emplace_back(id, pending[i].get());
        } catch (const exception &e) {
            LOG(WARNING) << "Judge " << id << " failed: " << e.what();
            scores.emplace_back(id, absolute_score::zero(fmt::format("Judge failed: {}", e.what()), "Judge failed"));
        }
    }
    return aggregate_scores(scores, aggregation, threshold);
}

}  // namespace vibe
