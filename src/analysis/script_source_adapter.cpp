#include <boost/algorithm/string.hpp>
#include <regex>
#include "analysis/source_analysis.hpp"
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"

namespace vibe {
using namespace std;

static int count_occurrences(const string &text, const string &needle) {
    int count = 0;
    for (size_t pos = text.find(needle); pos != string::npos; pos = text.find(needle, pos + needle.length()))
        ++count;
    return count;
}

source_analysis script_source_adapter::analyze(const string &source, const string &filename) const {
    static const regex console_call(R"(console\.(log|error|warn|debug)\s*\()");

    source_analysis analysis;
    auto lines = split_lines(source);
    analysis.total_lines = lines.size();
    for (auto &line : lines)
        if (utf8_length(line) > 120)
            ++analysis.long_lines;

    analysis.debug_output_count = distance(sregex_iterator(source.begin(), source.end(), console_call), sregex_iterator());
    analysis.todo_count = count_occurrences(source, "TODO") + count_occurrences(source, "FIXME");
    analysis.has_error_handling = source.find("try") != string::npos && source.find("catch") != string::npos;

    if (ends_with(filename, ".html") && boost::algorithm::to_lower_copy(source).find("<html") == string::npos)
        analysis.issues.push_back({0, "warning", "Missing <html> tag"});
    return analysis;
}

const source_adapter *adapter_for(const string &filename) {
    static const python_source_adapter python{};
    static const script_source_adapter script{};
    if (ends_with(filename, ".py"))
        return &python;
    if (ends_with(filename, ".html") || ends_with(filename, ".js"))
        return &script;
    return nullptr;
}

}  // namespace vibe
