#include "sandbox/command_gate.hpp"
#include <boost/algorithm/string.hpp>
#include <fmt/core.h>

namespace vibe {
using namespace std;

const char *const BLOCKED_MARKER = "BLOCKED";

// clang-format off
static const vector<string> blocked_patterns = {
    // Python
    "pip install", "pip3 install", "pip uninstall", "pip3 uninstall",
    "python -m pip install", "python3 -m pip install",
    "python -m pip uninstall", "python3 -m pip uninstall",
    "conda install", "conda create", "mamba install",
    "poetry add", "poetry install", "pipenv install", "pdm add",
    // JavaScript
    "npm install", "npm i ", "npm ci", "npm add",
    "yarn add", "yarn install", "pnpm install", "pnpm add",
    "bun install", "bun add",
    // 系统包管理器
    "brew install", "apt install", "apt-get install",
    "yum install", "dnf install", "pacman -s",
    // 其他语言
    "cargo add", "cargo install", "go get", "go install",
    "gem install", "bundle install", "composer require", "composer install",
    "nuget install", "dotnet add package"
};
// clang-format on

const vector<string> &blocked_command_patterns() {
    return blocked_patterns;
}

optional<string> find_blocked_pattern(const string &command) {
    string lowered = boost::algorithm::to_lower_copy(command);
    for (auto &pattern : blocked_patterns)
        if (lowered.find(pattern) != string::npos)
            return pattern;
    return nullopt;
}

bool is_command_allowed(const string &command) {
    return !find_blocked_pattern(command);
}

string blocked_command_message(const string &pattern) {
    return fmt::format("{}: Package manager commands are not allowed. "
                       "This benchmark requires zero external dependencies.\n"
                       "Blocked command pattern: '{}'",
                       BLOCKED_MARKER, pattern);
}

}  // namespace vibe
