#include "judge/judge_client.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <regex>
#include <set>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace vibe {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

static const set<string> code_extensions = {
    ".py", ".js", ".ts", ".jsx", ".tsx", ".html", ".css",
    ".json", ".yaml", ".yml", ".toml", ".md", ".txt",
    ".sh", ".bash", ".sql", ".go", ".rs", ".java"};

static const size_t MAX_FILE_CHARS = 100000;

code_files collect_code_files(const fs::path &workspace, size_t max_files) {
    code_files files;
    if (!fs::is_directory(workspace)) return files;

    vector<string> listed;
    try {
        listed = list_files_recursive(workspace);
    } catch (const exception &e) {
        LOG(WARNING) << "Unable to list " << workspace << ": " << e.what();
        return files;
    }
    for (auto &file : listed) {
        if (!code_extensions.count(fs::path(file).extension().string())) continue;
        if (files.size() >= max_files) break;
        try {
            string content = read_file_content(workspace / file);
            if (content.length() > MAX_FILE_CHARS)
                content = content.substr(0, MAX_FILE_CHARS) + "\n\n... (truncated)";
            files[file] = utf8_sanitize(content);
        } catch (const exception &e) {
            LOG(WARNING) << "Skipping unreadable file " << workspace / file << ": " << e.what();
        }
    }
    return files;
}

absolute_score empty_workspace_score() {
    absolute_score score;
    score.executes = {0, "No files were generated"};
    score.features_complete = {0, "No implementation"};
    score.output_quality = {0, "No output"};
    score.direction_following = {0, "No attempt"};
    score.code_quality = {0, "No code"};
    return score;
}

string format_code_files(const code_files &files) {
    string result;
    for (auto &[path, content] : files) {
        if (!result.empty()) result += "\n\n";
        result += fmt::format("### {}\n```\n{}\n```", path, content);
    }
    return result;
}

string build_judge_prompt(const string &spec, const code_files &files, const optional<string> &criteria) {
    string criteria_section;
    if (criteria && !criteria->empty())
        criteria_section = "\n\n## Additional Evaluation Criteria:\n" + *criteria;

    return fmt::format(R"(You are a STRICT code reviewer evaluating AI-generated code. Your job is to find problems and score harshly but fairly.

## Original Spec:
{}
{}

## Generated Code:
{}

## Scoring Guidelines

Score STRICTLY on a 0-10 scale. Most implementations should score 4-7. Only exceptional, production-ready code gets 8+.

Score anchors:
- 0-2: Broken, won't run, or completely wrong approach
- 3-4: Partially works but has significant issues or missing features
- 5-6: Works for basic cases but has bugs, edge cases fail, or missing features
- 7-8: Solid implementation, works correctly, minor issues only
- 9-10: Production-quality, handles edge cases, excellent code - RARE

Be harsh on:
- Missing error handling
- Missing features from spec, each missing feature costs at least 2 points
- Code that looks plausible but would not actually work, which gets a low EXECUTES score
- Hardcoded values or shortcuts that bypass the real requirement
- Incomplete implementations such as TODO comments or placeholder functions
- External dependencies (pip install, npm install), which make EXECUTES 0

## Dimensions to score:

1. EXECUTES (0-10): Would this ACTUALLY run without errors? Check imports, syntax, API usage.
   - If obvious runtime errors, score <= 3
   - If uses external packages not in Python stdlib, score 0
2. FEATURES_COMPLETE (0-10): Check EACH feature in the spec.
   - Missing ANY feature = max score of 6
   - Missing HALF = max score of 3
3. OUTPUT_QUALITY (0-10): Would output actually match expectations? Verify the logic produces correct results.
4. DIRECTION_FOLLOWING (0-10): Did they build EXACTLY what was asked?
   - Wrong framework, extra unwanted features, or misinterpreting the spec = penalize
5. CODE_QUALITY (0-10): Is it readable, well-organized, idiomatic?
   - No error handling = max 5
   - Poor structure = max 6

Respond ONLY with JSON:
{{
  "executes": {{"score": N, "reason": "..."}},
  "features_complete": {{"score": N, "reason": "..."}},
  "output_quality": {{"score": N, "reason": "..."}},
  "direction_following": {{"score": N, "reason": "..."}},
  "code_quality": {{"score": N, "reason": "..."}}
}}
)",
                       spec, criteria_section, format_code_files(files));
}

string extract_json(const string &text) {
    static const regex fenced(R"(```(?:json)?\s*\n?([\s\S]*?)\n?```)");
    static const regex object(R"(\{[\s\S]*\})");
    smatch match;
    if (regex_search(text, match, fenced)) {
        string body = match[1].str();
        size_t begin = body.find_first_not_of(" \t\r\n");
        size_t end = body.find_last_not_of(" \t\r\n");
        return begin == string::npos ? "" : body.substr(begin, end - begin + 1);
    }
    if (regex_search(text, match, object))
        return match[0].str();
    return text;
}

absolute_score parse_judge_reply(const string &reply, const judge_metrics &metrics) {
    absolute_score score;
    try {
        json scores = json::parse(extract_json(reply));
        from_json(scores, score);
        for (auto &name : absolute_score::dimension_names()) {
            int &value = score.dimension(name).score;
            value = max(0, min(10, value));
        }
    } catch (const exception &e) {
        score = absolute_score::zero(fmt::format("Judge parsing error: {}", e.what()), "Could not parse");
    }
    score.metrics = metrics;
    return score;
}

}  // namespace vibe
