#include "judge/http_judge_client.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace vibe {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, judge_config &config) {
    config.model = get_value<string>(j, "model");
    config.id = get_value_def<string>(j, config.model, "id");
    assign_optional(j, config.endpoint, "endpoint");
    assign_optional(j, config.api_key_env, "api_key_env");
    assign_optional(j, config.timeout, "timeout");
    assign_optional(j, config.max_tokens, "max_tokens");
}

void to_json(json &j, const judge_config &config) {
    j = {{"id", config.id},
         {"model", config.model},
         {"endpoint", config.endpoint},
         {"api_key_env", config.api_key_env},
         {"timeout", config.timeout},
         {"max_tokens", config.max_tokens}};
}

http_judge_client::http_judge_client(judge_config config)
    : config(move(config)) {
    if (this->config.id.empty()) this->config.id = this->config.model;
}

string http_judge_client::id() const {
    return config.id;
}

static size_t append_body(char *data, size_t size, size_t nmemb, void *userdata) {
    static_cast<string *>(userdata)->append(data, size * nmemb);
    return size * nmemb;
}

pair<string, judge_metrics> http_judge_client::complete(const string &prompt) const {
    string api_key = get_env(config.api_key_env, "");
    if (api_key.empty())
        throw network_error(config.api_key_env + " environment variable not set");

    json request = {{"model", config.model},
                    {"messages", json::array({{{"role", "user"}, {"content", prompt}}})},
                    {"max_tokens", config.max_tokens},
                    {"temperature", 0}};
    string body = request.dump(), response;

    CURL *curl = curl_easy_init();
    if (!curl) throw network_error("unable to initialize curl");
    defer { curl_easy_cleanup(curl); };

    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, ("Authorization: Bearer " + api_key).c_str());
    defer { curl_slist_free_all(headers); };

    curl_easy_setopt(curl, CURLOPT_URL, config.endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.size());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, (long)(config.timeout * 1000));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (DEBUG) curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK)
        throw network_error(fmt::format("request to {} failed: {}", config.endpoint, curl_easy_strerror(res)));

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300)
        throw network_error(fmt::format("judge {} returned HTTP {}: {}", config.id, status, truncate_text(response, 500, "...")));

    json reply = json::parse(response, nullptr, false);
    if (reply.is_discarded() || !exists(reply, "choices"))
        throw network_error(fmt::format("judge {} returned a malformed reply: {}", config.id, truncate_text(response, 500, "...")));

    judge_metrics metrics;
    metrics.judge_model = config.model;
    metrics.input_tokens = get_value_def<long>(reply, 0, "usage", "prompt_tokens");
    metrics.output_tokens = get_value_def<long>(reply, 0, "usage", "completion_tokens");

    const json &choices = reply.at("choices");
    if (!choices.is_array() || choices.empty())
        throw network_error(fmt::format("judge {} returned no choices", config.id));
    string content = get_value_def<string>(choices.at(0), "", "message", "content");
    return {content, metrics};
}

absolute_score http_judge_client::score(const string &spec,
                                        const code_files &files,
                                        const optional<string> &criteria) const {
    if (files.empty()) return empty_workspace_score();

    LOG(INFO) << "Requesting judge " << config.id << " with " << files.size() << " files";
    auto [content, metrics] = complete(build_judge_prompt(spec, files, criteria));
    return parse_judge_reply(content, metrics);
}

}  // namespace vibe
