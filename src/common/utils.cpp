#include "common/utils.hpp"
#include <fmt/core.h>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace vibe {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

string truncate_output(const string &text, size_t max_chars) {
    if (text.length() <= max_chars) return text;
    return text.substr(0, max_chars) + fmt::format("\n... (truncated, {} total chars)", text.length());
}

string truncate_text(const string &text, size_t max_chars, const string &suffix) {
    if (text.length() <= max_chars) return text;
    return text.substr(0, max_chars) + suffix;
}

double round_to(double value, int digits) {
    double factor = pow(10.0, digits);
    return round(value * factor) / factor;
}

string shell_quote(const string &arg) {
    string result = "'";
    for (char c : arg) {
        if (c == '\'')
            result += "'\\''";
        else
            result += c;
    }
    result += "'";
    return result;
}

string file_url(const filesystem::path &path) {
    static const char *hex = "0123456789ABCDEF";
    string url = "file://";
    for (unsigned char c : filesystem::absolute(path).string()) {
        if (isalnum(c) || c == '/' || c == '-' || c == '_' || c == '.' || c == '~') {
            url += c;
        } else {
            url += '%';
            url += hex[c >> 4];
            url += hex[c & 15];
        }
    }
    return url;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::duration<double>>().count();
}

}  // namespace vibe
