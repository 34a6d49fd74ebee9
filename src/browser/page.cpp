#include "browser/page.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <thread>
#include "common/exceptions.hpp"

namespace vibe {
using namespace std;
using json = nlohmann::json;

static string first_line(const string &text) {
    return text.substr(0, text.find('\n'));
}

static string describe_exception(const json &details) {
    json exception = details.value("exception", json::object());
    if (exception.contains("description") && exception["description"].is_string())
        return first_line(exception["description"].get<string>());
    if (exception.contains("value") && !exception["value"].is_null())
        return exception["value"].is_string() ? exception["value"].get<string>() : exception["value"].dump();
    return details.value("text", string("Uncaught exception"));
}

static string describe_remote_object(const json &arg) {
    if (arg.contains("value"))
        return arg["value"].is_string() ? arg["value"].get<string>() : arg["value"].dump();
    if (arg.contains("description"))
        return arg["description"].get<string>();
    return arg.value("type", string("undefined"));
}

// 生成返回匹配元素数组的 JavaScript 表达式
static string query(const string &selector, const string &has_text) {
    return fmt::format("(() => {{ const text = {1}.toLowerCase();"
                       " const all = Array.from(document.querySelectorAll({0}));"
                       " return text ? all.filter(e => (e.textContent || '').toLowerCase().includes(text)) : all; }})()",
                       json(selector).dump(), json(has_text).dump());
}

static string describe_selector(const string &selector, const string &has_text) {
    return has_text.empty() ? selector : fmt::format("{} (has text '{}')", selector, has_text);
}

browser_page::browser_page(shared_ptr<cdp_connection> connection, string target_id, string session_id, string owned_context)
    : connection(move(connection)), target_id(move(target_id)), session_id(move(session_id)), owned_context(move(owned_context)) {
    subscription = this->connection->subscribe(this->session_id, [this](const string &method, const json &params) {
        on_event(method, params);
    });
}

browser_page::~browser_page() {
    close();
}

void browser_page::on_event(const string &method, const json &params) {
    lock_guard<mutex> lock(state_mutex);
    if (method == "Page.loadEventFired") {
        ++load_count;
        load_cv.notify_all();
    } else if (method == "Page.lifecycleEvent") {
        if (params.value("name", string()) == "load") {
            loaded_documents.insert(params.value("loaderId", string()));
            load_cv.notify_all();
        }
    } else if (method == "Runtime.exceptionThrown") {
        collected_errors.push_back("JS Error: " + describe_exception(params.value("exceptionDetails", json::object())));
    } else if (method == "Runtime.consoleAPICalled") {
        if (params.value("type", string()) != "error") return;
        string text;
        for (auto &arg : params.value("args", json::array())) {
            if (!text.empty()) text += ' ';
            text += describe_remote_object(arg);
        }
        collected_errors.push_back("Console error: " + text);
    }
}

json browser_page::call(const string &method, const json &params, chrono::milliseconds timeout) {
    if (closed) throw browser_error("page has been closed");
    return connection->call(method, params, session_id, timeout.count() > 0 ? timeout : default_timeout);
}

void browser_page::set_default_timeout(int ms) {
    default_timeout = chrono::milliseconds(ms);
}

void browser_page::navigate(const string &url, int timeout_ms) {
    json result = call("Page.navigate", {{"url", url}}, chrono::milliseconds(timeout_ms));
    string error_text = result.value("errorText", string());
    if (!error_text.empty())
        throw browser_error(fmt::format("Navigation to {} failed: {}", url, error_text));

    // 同文档内的导航没有 loaderId，也不会触发 load
    string loader_id = result.value("loaderId", string());
    if (loader_id.empty()) return;

    unique_lock<mutex> lock(state_mutex);
    if (!load_cv.wait_for(lock, chrono::milliseconds(timeout_ms), [&] { return loaded_documents.count(loader_id) > 0; }))
        throw browser_error(fmt::format("Navigation to {} timed out after {}ms", url, timeout_ms));
}

void browser_page::reload(int timeout_ms) {
    int generation;
    {
        lock_guard<mutex> lock(state_mutex);
        generation = load_count;
    }
    call("Page.reload", json::object(), chrono::milliseconds(timeout_ms));

    unique_lock<mutex> lock(state_mutex);
    if (!load_cv.wait_for(lock, chrono::milliseconds(timeout_ms), [&] { return load_count > generation; }))
        throw browser_error(fmt::format("Reload timed out after {}ms", timeout_ms));
}

json browser_page::evaluate(const string &expression) {
    json result = call("Runtime.evaluate", {{"expression", expression},
                                            {"returnByValue", true},
                                            {"awaitPromise", true}});
    if (result.contains("exceptionDetails"))
        throw browser_error("Evaluation failed: " + describe_exception(result["exceptionDetails"]));
    return result.value("result", json::object()).value("value", json());
}

int browser_page::count(const string &selector, const string &has_text) {
    json value = evaluate(query(selector, has_text) + ".length");
    return value.is_number() ? value.get<int>() : 0;
}

string browser_page::text_content(const string &selector, const string &has_text) {
    json value = evaluate(fmt::format("(() => {{ const e = {}[0]; return e ? (e.textContent || '') : null; }})()",
                                      query(selector, has_text)));
    if (!value.is_string())
        throw browser_error("No element matches " + describe_selector(selector, has_text));
    return value.get<string>();
}

bool browser_page::element_action(const string &script) {
    json value = evaluate(script);
    return value.is_boolean() && value.get<bool>();
}

void browser_page::click(const string &selector, const string &has_text) {
    bool found = element_action(fmt::format(
        "(() => {{ const e = {}[0]; if (!e) return false;"
        " e.scrollIntoView({{block: 'center'}}); e.click(); return true; }})()",
        query(selector, has_text)));
    if (!found)
        throw browser_error("No element matches " + describe_selector(selector, has_text));
}

void browser_page::fill(const string &selector, const string &value) {
    bool found = element_action(fmt::format(
        "(() => {{ const e = {}[0]; if (!e) return false; e.focus(); e.value = {};"
        " e.dispatchEvent(new Event('input', {{bubbles: true}}));"
        " e.dispatchEvent(new Event('change', {{bubbles: true}})); return true; }})()",
        query(selector, ""), json(value).dump()));
    if (!found)
        throw browser_error("No element matches " + selector);
}

void browser_page::press(const string &selector, const string &key) {
    bool found = element_action(fmt::format(
        "(() => {{ const e = {}[0]; if (!e) return false; e.focus();"
        " for (const type of ['keydown', 'keypress', 'keyup'])"
        " e.dispatchEvent(new KeyboardEvent(type, {{key: {}, bubbles: true, cancelable: true}}));"
        " return true; }})()",
        query(selector, ""), json(key).dump()));
    if (!found)
        throw browser_error("No element matches " + selector);
}

void browser_page::wait_for_timeout(int ms) {
    this_thread::sleep_for(chrono::milliseconds(ms));
}

string browser_page::screenshot() {
    return call("Page.captureScreenshot", {{"format", "png"}}).value("data", string());
}

vector<string> browser_page::errors() const {
    lock_guard<mutex> lock(state_mutex);
    return collected_errors;
}

void browser_page::clear_errors() {
    lock_guard<mutex> lock(state_mutex);
    collected_errors.clear();
}

void browser_page::close() {
    if (closed) return;
    closed = true;
    connection->unsubscribe(subscription);
    if (!connection->alive()) return;
    try {
        connection->call("Target.closeTarget", {{"targetId", target_id}}, "", chrono::seconds(5));
        if (!owned_context.empty())
            connection->call("Target.disposeBrowserContext", {{"browserContextId", owned_context}}, "", chrono::seconds(5));
    } catch (const browser_error &e) {
        LOG(WARNING) << "Failed to close page " << target_id << ": " << e.what();
    }
}

// 清理失败时只记录日志，不覆盖原始异常
static void call_quietly(const shared_ptr<cdp_connection> &connection, const string &method, const json &params) {
    try {
        connection->call(method, params, "", chrono::seconds(5));
    } catch (const browser_error &e) {
        LOG(WARNING) << method << " failed: " << e.what();
    }
}

unique_ptr<browser_page> open_page(const shared_ptr<cdp_connection> &connection, const string &context_id, bool owns_context) {
    json params = {{"url", "about:blank"}};
    if (!context_id.empty()) params["browserContextId"] = context_id;

    string target_id, session_id;
    try {
        target_id = connection->call("Target.createTarget", params).at("targetId").get<string>();
        try {
            session_id = connection->call("Target.attachToTarget", {{"targetId", target_id}, {"flatten", true}}).at("sessionId").get<string>();
        } catch (const browser_error &) {
            call_quietly(connection, "Target.closeTarget", {{"targetId", target_id}});
            throw;
        }
    } catch (const browser_error &) {
        if (owns_context)
            call_quietly(connection, "Target.disposeBrowserContext", {{"browserContextId", context_id}});
        throw;
    }

    // 从这里开始由页面负责关闭标签页和销毁上下文
    auto page = make_unique<browser_page>(connection, target_id, session_id, owns_context ? context_id : "");
    page->call("Page.enable");
    page->call("Page.setLifecycleEventsEnabled", {{"enabled", true}});
    page->call("Runtime.enable");
    return page;
}

browser_context::browser_context(shared_ptr<cdp_connection> connection, string context_id)
    : connection(move(connection)), context_id(move(context_id)) {}

browser_context::~browser_context() {
    close();
}

unique_ptr<browser_page> browser_context::new_page() {
    if (closed) throw browser_error("browser context has been closed");
    return open_page(connection, context_id, false);
}

void browser_context::close() {
    if (closed) return;
    closed = true;
    if (!connection->alive()) return;
    try {
        connection->call("Target.disposeBrowserContext", {{"browserContextId", context_id}}, "", chrono::seconds(5));
    } catch (const browser_error &e) {
        LOG(WARNING) << "Failed to dispose browser context " << context_id << ": " << e.what();
    }
}

const string &browser_context::id() const {
    return context_id;
}

}  // namespace vibe
