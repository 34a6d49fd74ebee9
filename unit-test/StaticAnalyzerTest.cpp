#include "gtest/gtest.h"
#include "scoring/static_analyzer.hpp"
#include "test/workspace.hpp"

using namespace std;
using namespace vibe;

class StaticAnalyzerTest : public ::testing::Test {
protected:
    temp_workspace ws;
    static_analyzer analyzer;
};

TEST_F(StaticAnalyzerTest, AggregatesAcrossFiles) {
    ws.write("main.py", R"(def add(a: int, b: int) -> int:
    """Add two numbers."""
    return a + b


def main():
    try:
        print(add(1, 2))
    except Exception:
        pass
)");
    ws.write("broken.py", "def broken(:\n");
    ws.write("index.html", "<html><body><script>console.log(1)</script></body></html>");
    ws.write("notes.md", "# not analyzed");

    auto report = analyzer.analyze(ws.path());
    EXPECT_EQ(report.files_analyzed, 3);
    EXPECT_EQ(report.total_lines, 14);
    EXPECT_EQ(report.syntax_errors, 1);
    EXPECT_DOUBLE_EQ(report.avg_function_length, 4);
    EXPECT_EQ(report.max_function_length, 5);
    EXPECT_DOUBLE_EQ(report.docstring_coverage, 0.5);
    EXPECT_DOUBLE_EQ(report.type_hint_coverage, 0.5);
    EXPECT_TRUE(report.has_docstrings);
    EXPECT_TRUE(report.has_type_hints);
    EXPECT_DOUBLE_EQ(report.cyclomatic_complexity, 1);
    EXPECT_EQ(report.console_logs, 2);
    EXPECT_TRUE(report.has_error_handling);
    EXPECT_EQ(report.try_except_count, 1);

    ASSERT_EQ(report.issues.size(), 1u);
    EXPECT_EQ(report.issues[0].file, "broken.py");
    EXPECT_EQ(report.issues[0].type, "syntax_error");
    EXPECT_EQ(report.quality_score(), 8);
}

TEST_F(StaticAnalyzerTest, EmptyWorkspace) {
    auto report = analyzer.analyze(ws.path());
    EXPECT_EQ(report.files_analyzed, 0);
    EXPECT_DOUBLE_EQ(report.cyclomatic_complexity, 0);
    // 没有函数时文档覆盖率为 0
    EXPECT_EQ(report.quality_score(), 9);
    EXPECT_EQ(analyzer.analyze(ws.path() / "missing").files_analyzed, 0);
}

TEST_F(StaticAnalyzerTest, QualityPenalties) {
    static_report report;
    report.files_analyzed = 1;
    report.docstring_coverage = 1;
    report.has_error_handling = true;
    EXPECT_EQ(report.quality_score(), 10);

    report.syntax_errors = 4;
    EXPECT_EQ(report.quality_score(), 5);

    report.syntax_errors = 0;
    report.max_function_length = 60;
    report.has_error_handling = false;
    // 10 - 0.5 - 0.5 = 9
    EXPECT_EQ(report.quality_score(), 9);

    report.console_logs = 6;
    // 8.0
    EXPECT_EQ(report.quality_score(), 8);

    report.todo_count = 4;
    // 7.5 按四舍六入五成双取 8
    EXPECT_EQ(report.quality_score(), 8);

    report.long_lines = 11;
    report.max_function_length = 101;
    report.docstring_coverage = 0;
    report.syntax_errors = 10;
    EXPECT_EQ(report.quality_score(), 0);
}

TEST_F(StaticAnalyzerTest, SerializesReport) {
    static_report report;
    report.files_analyzed = 1;
    report.avg_function_length = 12.345;
    report.docstring_coverage = 2.0 / 3;
    for (int i = 0; i < 25; ++i) report.issues.push_back({"main.py", i, "warning", "long"});

    nlohmann::json j = report;
    EXPECT_DOUBLE_EQ(j.at("avg_function_length").get<double>(), 12.3);
    EXPECT_DOUBLE_EQ(j.at("docstring_coverage").get<double>(), 0.67);
    EXPECT_EQ(j.at("issues").size(), 20u);
    EXPECT_EQ(j.at("quality_score"), report.quality_score());

    auto parsed = j.get<static_report>();
    EXPECT_EQ(parsed.files_analyzed, 1);
    EXPECT_EQ(parsed.issues.size(), 20u);
}
