#include "browser/browser_pool.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <cerrno>
#include <cstring>
#include <thread>
#include <vector>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace vibe {
using namespace std;
namespace fs = std::filesystem;
using json = nlohmann::json;

static bool is_executable(const fs::path &path) {
    return !path.empty() && fs::is_regular_file(path) && access(path.c_str(), X_OK) == 0;
}

optional<string> find_browser_executable(const string &preferred) {
    if (!preferred.empty()) {
        if (is_executable(preferred)) return preferred;
        return nullopt;
    }
    for (auto &candidate : {CHROME_PATH, get_env("CHROME_PATH", "")})
        if (is_executable(candidate))
            return candidate;

    static const vector<string> names = {
        "chromium", "chromium-browser", "google-chrome", "google-chrome-stable", "headless_shell", "chrome"};

    vector<string> dirs;
    boost::split(dirs, get_env("PATH", "/usr/local/bin:/usr/bin:/bin"), boost::is_any_of(":"));
    for (auto &name : names)
        for (auto &dir : dirs)
            if (!dir.empty() && is_executable(fs::path(dir) / name))
                return (fs::path(dir) / name).string();

    for (auto &path : {"/usr/bin/chromium", "/usr/bin/chromium-browser", "/usr/bin/google-chrome",
                       "/snap/bin/chromium", "/opt/google/chrome/chrome"})
        if (is_executable(path))
            return string(path);
    return nullopt;
}

browser_pool::browser_pool(string executable)
    : executable(move(executable)) {}

browser_pool::~browser_pool() {
    close();
}

bool browser_pool::open() {
    return connect() != nullptr;
}

bool browser_pool::available() {
    return open();
}

shared_ptr<cdp_connection> browser_pool::connect() {
    lock_guard<mutex> lock(launch_mutex);
    if (connection && connection->alive()) return connection;
    if (failed) return nullptr;

    if (connection) {
        LOG(WARNING) << "Headless browser exited unexpectedly, relaunching";
        terminate();
    }

    try {
        launch();
    } catch (const eval_exception &e) {
        LOG(WARNING) << "Headless browser unavailable, falling back to structural checks: " << e.what();
        terminate();
        failed = true;
        return nullptr;
    } catch (const system_error &e) {
        LOG(WARNING) << "Headless browser unavailable, falling back to structural checks: " << e.what();
        terminate();
        failed = true;
        return nullptr;
    }
    return connection;
}

void browser_pool::launch() {
    auto path = find_browser_executable(executable);
    if (!path) throw browser_error("no Chromium based browser found");

    // 浏览器退出以后写管道会产生 SIGPIPE，这里要求 write 返回 EPIPE
    signal(SIGPIPE, SIG_IGN);

    char tmpl[] = "/tmp/vibe-browser-XXXXXX";
    if (!mkdtemp(tmpl))
        throw system_error(errno, system_category(), "unable to create browser profile directory");
    profile_dir = tmpl;

    vector<string> args = {
        *path,
        "--headless=new",
        "--remote-debugging-pipe",
        "--no-sandbox",
        "--disable-gpu",
        "--disable-dev-shm-usage",
        "--no-first-run",
        "--no-default-browser-check",
        "--disable-extensions",
        "--allow-file-access-from-files",
        "--user-data-dir=" + profile_dir.string(),
        "about:blank"};
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    int to_browser[2], from_browser[2];
    if (pipe2(to_browser, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "unable to create pipe");
    if (pipe2(from_browser, O_CLOEXEC) != 0) {
        int err = errno;
        ::close(to_browser[0]), ::close(to_browser[1]);
        throw system_error(err, system_category(), "unable to create pipe");
    }

    pid_t child = fork();
    if (child < 0) {
        int err = errno;
        for (int fd : {to_browser[0], to_browser[1], from_browser[0], from_browser[1]}) ::close(fd);
        throw system_error(err, system_category(), "unable to fork");
    }
    if (child == 0) {  // 子进程，只能调用异步信号安全的函数
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        int in = fcntl(to_browser[0], F_DUPFD_CLOEXEC, 10);
        int out = fcntl(from_browser[1], F_DUPFD_CLOEXEC, 10);
        int null_fd = ::open("/dev/null", O_RDWR);
        if (in < 0 || out < 0 || null_fd < 0) _exit(127);
        dup2(null_fd, STDIN_FILENO);
        dup2(null_fd, STDOUT_FILENO);
        if (!DEBUG) dup2(null_fd, STDERR_FILENO);
        dup2(in, 3);
        dup2(out, 4);
        execv(argv[0], argv.data());
        _exit(127);
    }

    pid = child;
    ::close(to_browser[0]);
    ::close(from_browser[1]);
    connection = make_shared<cdp_connection>(to_browser[1], from_browser[0]);

    json version = connection->call("Browser.getVersion", json::object(), "", chrono::seconds(10));
    LOG(INFO) << "Launched headless browser " << version.value("product", string("unknown")) << " (" << *path << ")";
}

void browser_pool::terminate() {
    if (connection) {
        if (connection->alive()) {
            try {
                connection->call("Browser.close", json::object(), "", chrono::seconds(2));
            } catch (const browser_error &e) {
                LOG(WARNING) << "Failed to close browser gracefully: " << e.what();
            }
        }
        connection->close();
        connection.reset();
    }

    if (pid > 0) {
        int status;
        bool exited = false;
        for (int i = 0; i < 20 && !exited; ++i) {
            exited = waitpid(pid, &status, WNOHANG) == pid;
            if (!exited) this_thread::sleep_for(chrono::milliseconds(100));
        }
        if (!exited) {
            kill(-pid, SIGKILL);
            waitpid(pid, &status, 0);
        }
        pid = -1;
    }

    if (!profile_dir.empty()) {
        if (!DEBUG) {
            error_code ec;
            fs::remove_all(profile_dir, ec);
        }
        profile_dir.clear();
    }
}

void browser_pool::close() {
    lock_guard<mutex> lock(launch_mutex);
    if (connection || pid > 0) LOG(INFO) << "Closing headless browser";
    terminate();
}

unique_ptr<browser_context> browser_pool::acquire_context() {
    auto conn = connect();
    if (!conn) return nullptr;
    json result = conn->call("Target.createBrowserContext", {{"disposeOnDetach", true}});
    return make_unique<browser_context>(conn, result.at("browserContextId").get<string>());
}

unique_ptr<browser_page> browser_pool::acquire_page() {
    auto conn = connect();
    if (!conn) return nullptr;
    json result = conn->call("Target.createBrowserContext", {{"disposeOnDetach", true}});
    return open_page(conn, result.at("browserContextId").get<string>(), true);
}

}  // namespace vibe
