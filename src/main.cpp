#include <glog/logging.h>
#include <curl/curl.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <nlohmann/json.hpp>
#include "browser/browser_pool.hpp"
#include "common/io_utils.hpp"
#include "common/python.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/comparative_judge.hpp"
#include "judge/multi_judge.hpp"
#include "sandbox/validator.hpp"
#include "scoring/score_aggregator.hpp"
#include "testing/suite_registry.hpp"
using namespace std;
using namespace vibe;
namespace fs = std::filesystem;
namespace po = boost::program_options;

/**
 * @brief 读取命令行参数，没有时读取环境变量
 */
template <typename T>
static bool load_option(const po::variables_map &vm, const char *option, const char *env, T &value) {
    if (vm.count(option)) {
        value = vm.at(option).as<T>();
        return true;
    } else if (getenv(env)) {
        value = boost::lexical_cast<T>(getenv(env));
        return true;
    }
    return false;
}

// "runs/model-a/" 的名称为 model-a
static string workspace_name(fs::path dir) {
    if (dir.filename().empty()) dir = dir.parent_path();
    return dir.filename().string();
}

static void write_result(const po::variables_map &vm, const nlohmann::json &result) {
    if (vm.count("output")) {
        write_file_content(vm.at("output").as<string>(), result.dump(2) + "\n");
        LOG(INFO) << "Result written to " << vm.at("output").as<string>();
    } else {
        cout << result.dump(2) << endl;
    }
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    po::options_description desc("vibe-judge options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("workspace", po::value<string>()->required(), "directory containing the generated code to evaluate")
        ("case-dir", po::value<string>(), "case directory holding tests.json, or named after a built-in test suite")
        ("spec", po::value<string>(), "file with the task description given to the judges")
        ("judges", po::value<string>(), "judge configuration file in JSON, default to the built-in judges")
        ("no-judge", "do not request any judge even if a task description is given")
        ("metrics", po::value<string>(), "agent metrics file in JSON, used for the efficiency dimension")
        ("output", po::value<string>(), "write the result to this file instead of stdout")
        ("validate-only", "only check whether the code runs and print the execution report")
        ("compare", po::value<string>(), "compare the workspace head-to-head with another workspace using the first judge, requires --spec")
        ("sandbox-time-limit", po::value<double>(), "time limit in seconds of sandboxed commands, default to 60. You can either pass it from environ SANDBOX_TIME_LIMIT")
        ("validation-time-limit", po::value<double>(), "time limit in seconds of execution validation, default to 30. You can either pass it from environ VALIDATION_TIME_LIMIT")
        ("test-time-limit", po::value<double>(), "time limit in seconds of each functional test step, default to 30. You can either pass it from environ TEST_TIME_LIMIT")
        ("judge-time-limit", po::value<double>(), "time limit in seconds of each judge request, default to 120. You can either pass it from environ JUDGE_TIME_LIMIT")
        ("page-load-timeout", po::value<int>(), "time limit in milliseconds of page loading, default to 10000. You can either pass it from environ PAGE_LOAD_TIMEOUT")
        ("chrome", po::value<string>(), "headless browser executable, searched in PATH by default. You can either pass it from environ CHROME_PATH")
        ("python", po::value<string>(), "python interpreter running the generated scripts, default to python3. You can either pass it from environ PYTHON")
        ("debug", "turn on the debug mode to keep the browser profile and log sandboxed commands")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        if (vm.count("help")) {
            cout << "vibe-judge: run, test and score generated code" << endl
                 << "Usage: " << argv[0] << " --workspace <dir> [options]" << endl;
            cout << desc << endl;
            return EXIT_SUCCESS;
        }
        if (vm.count("version")) {
            cout << "vibe-judge 1.0" << endl;
            return EXIT_SUCCESS;
        }
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("debug") || getenv("DEBUG")) DEBUG = true;

    try {
        load_option(vm, "sandbox-time-limit", "SANDBOX_TIME_LIMIT", SANDBOX_TIME_LIMIT);
        load_option(vm, "validation-time-limit", "VALIDATION_TIME_LIMIT", VALIDATION_TIME_LIMIT);
        load_option(vm, "test-time-limit", "TEST_TIME_LIMIT", TEST_TIME_LIMIT);
        load_option(vm, "judge-time-limit", "JUDGE_TIME_LIMIT", JUDGE_TIME_LIMIT);
        load_option(vm, "page-load-timeout", "PAGE_LOAD_TIMEOUT", PAGE_LOAD_TIMEOUT);
        load_option(vm, "chrome", "CHROME_PATH", CHROME_PATH);
        load_option(vm, "python", "PYTHON", PYTHON_EXECUTABLE);
    } catch (boost::bad_lexical_cast &e) {
        cerr << "Invalid numeric value in environment: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    fs::path workspace = fs::absolute(vm.at("workspace").as<string>());
    CHECK(fs::is_directory(workspace))
        << "Workspace " << workspace << " does not exist";

    optional<fs::path> case_dir;
    if (vm.count("case-dir")) {
        case_dir = fs::absolute(vm.at("case-dir").as<string>());
        CHECK(fs::is_directory(*case_dir))
            << "Case directory " << *case_dir << " does not exist";
    }

    python_initialize(argv[0]);
    PyThread_guard guard;

    // 浏览器管道关闭时不应终止评测进程
    signal(SIGPIPE, SIG_IGN);
    curl_global_init(CURL_GLOBAL_DEFAULT);

    browser_pool pool(CHROME_PATH);
    int exit_code = EXIT_SUCCESS;
    try {
        if (vm.count("validate-only")) {
            execution_validator validator(pool);
            write_result(vm, validator.validate(workspace));
        } else if (vm.count("compare")) {
            CHECK(vm.count("spec")) << "--compare requires --spec";
            fs::path other = fs::absolute(vm.at("compare").as<string>());
            CHECK(fs::is_directory(other)) << "Workspace " << other << " does not exist";

            arbitration_config config;
            if (vm.count("judges"))
                config = nlohmann::json::parse(read_file_content(vm.at("judges").as<string>())).get<arbitration_config>();
            comparative_judge judge(config.judges.empty() ? default_judges().front() : config.judges.front());
            comparison_result result = judge.compare(read_file_content(vm.at("spec").as<string>()), workspace, other,
                                                     workspace_name(workspace), workspace_name(other));
            LOG(INFO) << "Comparison winner: " << result.winner_name();
            write_result(vm, result);
        } else {
            optional<string> spec;
            if (vm.count("spec")) spec = read_file_content(vm.at("spec").as<string>());

            optional<agent_metrics> metrics;
            if (vm.count("metrics"))
                metrics = nlohmann::json::parse(read_file_content(vm.at("metrics").as<string>())).get<agent_metrics>();

            arbitration_config config;
            if (vm.count("judges"))
                config = nlohmann::json::parse(read_file_content(vm.at("judges").as<string>())).get<arbitration_config>();
            unique_ptr<multi_judge_arbitrator> judges;
            if (spec && !vm.count("no-judge"))
                judges = make_unique<multi_judge_arbitrator>(config);

            score_aggregator aggregator(pool, suite_registry::with_builtin_suites(), judges.get());
            final_score score = aggregator.score_workspace(workspace, case_dir, spec, metrics);
            LOG(INFO) << "Workspace " << workspace << " scored " << score.total_score()
                      << (score.execution_gated ? " (execution gated)" : "");
            write_result(vm, score);
        }
    } catch (exception &e) {
        LOG(ERROR) << "Evaluation failed: " << boost::diagnostic_information(e);
        exit_code = EXIT_FAILURE;
    }

    pool.close();
    curl_global_cleanup();
    return exit_code;
}
