#include "sandbox/executor.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "sandbox/command_gate.hpp"

extern char **environ;

namespace vibe {
using namespace std;
namespace fs = std::filesystem;

/**
 * @brief 保存子进程输出的缓冲区，只保留前 limit 个字节，但记录总长度
 */
struct output_capture {
    explicit output_capture(size_t limit) : limit(limit) {}

    void append(const char *buf, size_t len) {
        if (data.length() < limit)
            data.append(buf, min(len, limit - data.length()));
        total += len;
    }

    string str() const {
        string text = data;
        if (total > limit)
            text += fmt::format("\n... (truncated, {} total chars)", total);
        return utf8_sanitize(text);
    }

    string data;
    size_t total = 0;
    size_t limit;
};

// 先 SIGTERM，给 0.1s 让进程自行退出，再 SIGKILL
static void kill_process_group(pid_t pid) {
    kill(-pid, SIGTERM);
    struct timespec ts = {0, 100000000};
    nanosleep(&ts, nullptr);
    kill(-pid, SIGKILL);
}

// 读取 fd 中当前可读的全部内容，返回 false 表示已经读到 EOF
static bool drain(int fd, output_capture &capture) {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            capture.append(buf, n);
        } else if (n == 0) {
            return false;
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        } else {
            return false;
        }
    }
}

static int open_stdin(const string &input) {
    if (input.empty()) {
        int fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (fd < 0) throw system_error(errno, system_category(), "unable to open /dev/null");
        return fd;
    }

    char tmpl[] = "/tmp/vibe-stdin-XXXXXX";
    int fd = mkostemp(tmpl, O_CLOEXEC);
    if (fd < 0) throw system_error(errno, system_category(), "unable to create stdin file");
    unlink(tmpl);
    size_t written = 0;
    while (written < input.length()) {
        ssize_t n = write(fd, input.data() + written, input.length() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            close(fd);
            throw system_error(err, system_category(), "unable to write stdin file");
        }
        written += n;
    }
    lseek(fd, 0, SEEK_SET);
    return fd;
}

execution_result run_command(const string &command, const fs::path &workdir, double timeout, size_t max_output_chars, const string &input) {
    execution_result result;

    if (auto pattern = find_blocked_pattern(command)) {
        LOG(WARNING) << "Blocked command " << command;
        result.success = false;
        result.stderr_text = blocked_command_message(*pattern);
        result.return_code = 1;
        return result;
    }

    if (!fs::is_directory(workdir)) {
        result.stderr_text = "Working directory does not exist: " + workdir.string();
        result.return_code = 1;
        return result;
    }

    if (DEBUG) LOG(INFO) << "Running " << command << " in " << workdir.string();

    // fork 以后子进程只能调用异步信号安全的函数，所以参数和环境变量在这里准备好
    string workdir_str = workdir.string();
    const char *argv[] = {"sh", "-c", command.c_str(), nullptr};
    vector<string> env_strings;
    for (char **env = environ; env && *env; ++env)
        if (strncmp(*env, "PYTHONUNBUFFERED=", 17) != 0)
            env_strings.push_back(*env);
    env_strings.push_back("PYTHONUNBUFFERED=1");
    vector<char *> envp;
    for (auto &s : env_strings) envp.push_back(s.data());
    envp.push_back(nullptr);

    int stdin_fd = open_stdin(input);
    defer { close(stdin_fd); };

    int out_pipe[2], err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "unable to create pipe");
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close(out_pipe[0]), close(out_pipe[1]);
        throw system_error(err, system_category(), "unable to create pipe");
    }
    defer {
        close(out_pipe[0]);
        close(err_pipe[0]);
    };

    elapsed_time timer;
    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(out_pipe[1]), close(err_pipe[1]);
        throw internal_error(fmt::format("unable to fork: {}", strerror(err)));
    }
    if (pid == 0) {  // 子进程
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        if (chdir(workdir_str.c_str()) != 0) _exit(127);
        dup2(stdin_fd, STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        execve("/bin/sh", (char **)argv, envp.data());
        _exit(127);
    }

    // 父进程也设置一次进程组，避免子进程还没来得及 setpgid 时就需要 kill
    setpgid(pid, pid);
    close(out_pipe[1]);
    close(err_pipe[1]);
    fcntl(out_pipe[0], F_SETFL, fcntl(out_pipe[0], F_GETFL) | O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, fcntl(err_pipe[0], F_GETFL) | O_NONBLOCK);

    output_capture out(max_output_chars), err(max_output_chars);
    bool out_open = true, err_open = true, exited = false;
    int status = 0;
    auto deadline = chrono::steady_clock::now() +
                    chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(timeout));

    // 保证任何路径下子进程都会被回收
    defer {
        if (!exited) {
            kill_process_group(pid);
            waitpid(pid, &status, 0);
        }
    };

    while (out_open || err_open || !exited) {
        if (!exited && waitpid(pid, &status, WNOHANG) == pid) {
            exited = true;
            // shell 已经退出，清理遗留在进程组中的后台进程，使管道能够关闭
            kill(-pid, SIGKILL);
        }
        if (exited && !out_open && !err_open) break;

        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            if (!exited) {
                result.timed_out = true;
                kill_process_group(pid);
                waitpid(pid, &status, 0);
                exited = true;
            }
            break;
        }

        int remaining = (int)chrono::duration_cast<chrono::milliseconds>(deadline - now).count() + 1;
        int wait_ms = exited ? remaining : min(remaining, 50);
        pollfd fds[2];
        int nfds = 0;
        if (out_open) fds[nfds++] = {out_pipe[0], POLLIN, 0};
        if (err_open) fds[nfds++] = {err_pipe[0], POLLIN, 0};
        int ready = poll(fds, nfds, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "poll failed");
        }
        for (int i = 0; i < nfds; ++i) {
            if (!fds[i].revents) continue;
            if (fds[i].fd == out_pipe[0])
                out_open = drain(out_pipe[0], out);
            else
                err_open = drain(err_pipe[0], err);
        }
    }

    result.execution_time = timer.seconds();
    result.stdout_text = out.str();
    if (result.timed_out) {
        result.return_code = -1;
        result.stderr_text = fmt::format("Command timed out after {:g} seconds", timeout);
    } else {
        if (WIFEXITED(status))
            result.return_code = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
            result.return_code = -WTERMSIG(status);
        else
            result.return_code = -1;
        result.stderr_text = err.str();
    }
    result.success = result.return_code == 0;
    return result;
}

sandbox_executor::sandbox_executor(const fs::path &workspace, double timeout, size_t max_output_chars)
    : workspace_dir(workspace), time_limit(timeout), max_output(max_output_chars) {
    fs::create_directories(workspace_dir);
}

execution_result sandbox_executor::run(const string &command) const {
    return run(command, time_limit);
}

execution_result sandbox_executor::run(const string &command, double timeout, const string &input) const {
    return run_command(command, workspace_dir, timeout, max_output, input);
}

void sandbox_executor::write_file(const string &path, const string &content) const {
    write_file_content(workspace_dir / assert_safe_path(path), content);
}

optional<string> sandbox_executor::read_file(const string &path) const {
    fs::path file = workspace_dir / assert_safe_path(path);
    if (!fs::is_regular_file(file)) return nullopt;
    return read_file_content(file);
}

vector<string> sandbox_executor::list_files() const {
    return list_files_recursive(workspace_dir);
}

void sandbox_executor::cleanup() const {
    error_code ec;
    fs::remove_all(workspace_dir, ec);
    if (ec) LOG(WARNING) << "Unable to remove workspace " << workspace_dir << ": " << ec.message();
}

const fs::path &sandbox_executor::workspace() const {
    return workspace_dir;
}

double sandbox_executor::timeout() const {
    return time_limit;
}

}  // namespace vibe
