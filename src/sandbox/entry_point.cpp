#include "sandbox/entry_point.hpp"
#include <string>
#include <vector>
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"

namespace vibe {
using namespace std;
namespace fs = std::filesystem;

static vector<string> files_with_extension(const fs::path &workspace, const string &extension) {
    vector<string> result;
    for (auto &file : list_files_recursive(workspace))
        if (ends_with(file, extension))
            result.push_back(file);
    return result;
}

static optional<string> find_by_priority(const vector<string> &files, const vector<string> &priority) {
    for (auto &name : priority)
        for (auto &file : files)
            if (fs::path(file).filename() == name)
                return file;
    return nullopt;
}

optional<fs::path> find_python_entry(const fs::path &workspace) {
    auto files = files_with_extension(workspace, ".py");
    if (files.empty()) return nullopt;

    auto entry = find_by_priority(files, {"main.py", "app.py", "index.py", "run.py", "server.py"});
    if (!entry) {
        for (auto &file : files)
            if (file.find('/') == string::npos) {
                entry = file;
                break;
            }
    }
    return fs::absolute(workspace / entry.value_or(files.front()));
}

optional<fs::path> find_html_entry(const fs::path &workspace) {
    auto files = files_with_extension(workspace, ".html");
    if (files.empty()) return nullopt;

    auto entry = find_by_priority(files, {"index.html", "main.html", "app.html"});
    return fs::absolute(workspace / entry.value_or(files.front()));
}

}  // namespace vibe
