#include "common/io_utils.hpp"
#include <algorithm>
#include <fstream>
#include <set>
#include <stdexcept>
#include "common/exceptions.hpp"

namespace vibe {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw internal_error("unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(filesystem::path const &path, const string &def) {
    if (!filesystem::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw internal_error("unable to write file " + path.string());
    fout << content;
}

// 返回从 i 开始的合法 UTF-8 序列的长度，非法时返回 0
static size_t utf8_sequence_length(const string &string, size_t i) {
    size_t ix = string.length();
    int c = (unsigned char)string[i], n;
    if (c <= 0x7f)
        n = 0;  // 0bbbbbbb
    else if ((c & 0xE0) == 0xC0)
        n = 1;  // 110bbbbb
    else if (c == 0xed && i < (ix - 1) && ((unsigned char)string[i + 1] & 0xa0) == 0xa0)
        return 0;  //U+d800 to U+dfff
    else if ((c & 0xF0) == 0xE0)
        n = 2;  // 1110bbbb
    else if ((c & 0xF8) == 0xF0)
        n = 3;  // 11110bbb
    else
        return 0;
    for (int j = 1; j <= n; j++) {  // n bytes matching 10bbbbbb follow ?
        if (i + j >= ix || ((unsigned char)string[i + j] & 0xC0) != 0x80)
            return 0;
    }
    return n + 1;
}

bool utf8_check_is_valid(const string &string) {
    for (size_t i = 0; i < string.length();) {
        size_t n = utf8_sequence_length(string, i);
        if (n == 0) return false;
        i += n;
    }
    return true;
}

size_t utf8_length(const string &string) {
    size_t length = 0;
    for (char c : string)
        if (((unsigned char)c & 0xC0) != 0x80)
            ++length;
    return length;
}

string utf8_sanitize(const string &string) {
    if (utf8_check_is_valid(string)) return string;
    std::string result;
    result.reserve(string.length());
    for (size_t i = 0; i < string.length();) {
        size_t n = utf8_sequence_length(string, i);
        if (n == 0) {
            result += '?';
            ++i;
        } else {
            result.append(string, i, n);
            i += n;
        }
    }
    return result;
}

string assert_safe_path(const string &subpath) {
    fs::path path(subpath);
    if (subpath.empty() || path.is_absolute())
        throw invalid_argument("subpath is not safe " + subpath);
    for (auto &part : path)
        if (part == "..")
            throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

// 虚拟环境、依赖与缓存目录不属于生成的代码
static bool is_ignored_directory(const fs::path &path) {
    static const set<string> ignored = {"__pycache__", "node_modules", "venv"};
    string name = path.filename().string();
    return (!name.empty() && name[0] == '.') || ignored.count(name);
}

vector<string> list_files_recursive(const fs::path &dir) {
    vector<string> files;
    if (!fs::is_directory(dir)) return files;
    // 无法访问的条目（例如循环的符号链接）直接跳过
    error_code ec, entry_ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(entry_ec) && is_ignored_directory(it->path())) {
            it.disable_recursion_pending();
            continue;
        }
        if (it->is_regular_file(entry_ec))
            files.push_back(it->path().lexically_relative(dir).generic_string());
    }
    if (ec)
        throw fs::filesystem_error("unable to list directory", dir, ec);
    sort(files.begin(), files.end());
    return files;
}

vector<string> split_lines(const string &content) {
    vector<string> lines;
    size_t start = 0;
    while (true) {
        size_t end = content.find('\n', start);
        if (end == string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

}  // namespace vibe
