#include "browser/cdp_connection.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <vector>
#include "common/exceptions.hpp"

namespace vibe {
using namespace std;
using json = nlohmann::json;

cdp_connection::cdp_connection(int write_fd, int read_fd)
    : write_fd(write_fd), read_fd(read_fd) {
    reader = thread([this] { reader_loop(); });
}

cdp_connection::~cdp_connection() {
    close();
    if (reader.joinable()) reader.join();
    ::close(read_fd);
}

json cdp_connection::call(const string &method, const json &params, const string &session_id, chrono::milliseconds timeout) {
    if (closed) throw browser_error("browser connection closed");

    auto promise = make_shared<std::promise<json>>();
    auto future = promise->get_future();
    int id;
    {
        lock_guard<mutex> lock(state_mutex);
        id = next_id++;
        pending[id] = promise;
    }

    json message = {{"id", id}, {"method", method}, {"params", params}};
    if (!session_id.empty()) message["sessionId"] = session_id;
    try {
        send(message);
    } catch (...) {
        lock_guard<mutex> lock(state_mutex);
        pending.erase(id);
        throw;
    }

    if (future.wait_for(timeout) != future_status::ready) {
        lock_guard<mutex> lock(state_mutex);
        pending.erase(id);
        throw browser_error(fmt::format("{} timed out after {}ms", method, timeout.count()));
    }
    return future.get();
}

int cdp_connection::subscribe(const string &session_id, event_handler handler) {
    lock_guard<mutex> lock(dispatch_mutex);
    int token = next_token++;
    handlers[token] = {session_id, move(handler)};
    return token;
}

void cdp_connection::unsubscribe(int token) {
    lock_guard<mutex> lock(dispatch_mutex);
    handlers.erase(token);
}

bool cdp_connection::alive() const {
    return !closed;
}

void cdp_connection::close() {
    if (closed.exchange(true)) return;
    {
        lock_guard<mutex> lock(write_mutex);
        ::close(write_fd);
    }
    fail_pending("browser connection closed");
}

void cdp_connection::send(const json &message) {
    string data = message.dump();
    data.push_back('\0');

    lock_guard<mutex> lock(write_mutex);
    if (closed) throw browser_error("browser connection closed");
    size_t written = 0;
    while (written < data.length()) {
        ssize_t n = write(write_fd, data.data() + written, data.length() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw browser_error(fmt::format("unable to write to browser: {}", strerror(errno)));
        }
        written += n;
    }
}

void cdp_connection::reader_loop() {
    string buffer;
    char chunk[65536];
    while (!closed) {
        pollfd fd = {read_fd, POLLIN, 0};
        int ready = poll(&fd, 1, 100);
        if (ready < 0 && errno != EINTR) break;
        if (ready <= 0) continue;

        ssize_t n = read(read_fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            break;
        }
        if (n == 0) break;  // 浏览器退出

        buffer.append(chunk, n);
        size_t start = 0, end;
        while ((end = buffer.find('\0', start)) != string::npos) {
            json message = json::parse(buffer.begin() + start, buffer.begin() + end, nullptr, false);
            if (message.is_discarded())
                LOG(WARNING) << "Malformed DevTools message from browser";
            else {
                try {
                    dispatch(message);
                } catch (const exception &e) {
                    LOG(ERROR) << "Failed to dispatch DevTools message: " << e.what();
                }
            }
            start = end + 1;
        }
        buffer.erase(0, start);
    }

    if (!closed.exchange(true)) {
        LOG(WARNING) << "Browser connection lost";
        lock_guard<mutex> lock(write_mutex);
        ::close(write_fd);
    }
    fail_pending("browser connection closed");
}

void cdp_connection::dispatch(const json &message) {
    if (message.contains("id")) {
        shared_ptr<promise<json>> promise;
        {
            lock_guard<mutex> lock(state_mutex);
            auto it = pending.find(message["id"].get<int>());
            if (it == pending.end()) return;  // 调用者已经超时
            promise = it->second;
            pending.erase(it);
        }
        if (message.contains("error"))
            promise->set_exception(make_exception_ptr(browser_error(message["error"].value("message", string("unknown protocol error")))));
        else
            promise->set_value(message.value("result", json::object()));
        return;
    }

    if (!message.contains("method")) return;
    string method = message["method"].get<string>();
    string session_id = message.value("sessionId", string());
    json params = message.value("params", json::object());

    lock_guard<mutex> lock(dispatch_mutex);
    for (auto &[token, entry] : handlers)
        if (entry.first == session_id)
            entry.second(method, params);
}

void cdp_connection::fail_pending(const string &reason) {
    map<int, shared_ptr<promise<json>>> failed;
    {
        lock_guard<mutex> lock(state_mutex);
        failed.swap(pending);
    }
    for (auto &[id, promise] : failed)
        promise->set_exception(make_exception_ptr(browser_error(reason)));
}

}  // namespace vibe
