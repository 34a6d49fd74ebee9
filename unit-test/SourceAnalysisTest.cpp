#include "analysis/source_analysis.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace vibe;

class SourceAnalysisTest : public ::testing::Test {
protected:
    python_source_adapter python;
    script_source_adapter script;
};

TEST_F(SourceAnalysisTest, CollectsPythonFunctions) {
    auto analysis = python.analyze(R"(def documented(a: int) -> int:
    """Double it."""
    return a * 2


def bare(x):
    return x


async def fetch():
    pass
)", "main.py");
    ASSERT_FALSE(analysis.error);
    ASSERT_EQ(analysis.functions.size(), 3u);
    EXPECT_EQ(analysis.functions[0].name, "documented");
    EXPECT_EQ(analysis.functions[0].line, 1);
    EXPECT_EQ(analysis.functions[0].length, 3);
    EXPECT_TRUE(analysis.functions[0].has_docstring);
    EXPECT_TRUE(analysis.functions[0].has_type_hints);
    EXPECT_FALSE(analysis.functions[1].has_docstring);
    EXPECT_FALSE(analysis.functions[1].has_type_hints);
    EXPECT_EQ(analysis.functions[2].name, "fetch");
}

TEST_F(SourceAnalysisTest, CountsComplexityAndErrorHandling) {
    auto analysis = python.analyze(R"(def f(items):
    total = 0
    for item in items:
        if item > 0 and item < 10:
            total += item
    try:
        return total
    except ValueError:
        return -1
)", "main.py");
    ASSERT_FALSE(analysis.error);
    // 基础 1，for、if、except 各 1，and 1
    EXPECT_EQ(analysis.complexity, 5);
    EXPECT_EQ(analysis.try_count, 1);
    EXPECT_TRUE(analysis.has_error_handling);
}

TEST_F(SourceAnalysisTest, ScansPythonLines) {
    string long_line = "x = '" + string(130, 'a') + "'";
    auto analysis = python.analyze("# TODO: cleanup\nprint('hi')\n# print('no')\n" + long_line + "\n", "main.py");
    EXPECT_EQ(analysis.total_lines, 5);
    EXPECT_EQ(analysis.todo_count, 1);
    EXPECT_EQ(analysis.debug_output_count, 1);
    EXPECT_EQ(analysis.long_lines, 1);
}

TEST_F(SourceAnalysisTest, ReportsSyntaxError) {
    auto analysis = python.analyze("x = 1\ndef broken(:\n    pass\n", "broken.py");
    ASSERT_TRUE(analysis.error);
    EXPECT_EQ(analysis.error->line, 2);
    ASSERT_EQ(analysis.issues.size(), 1u);
    EXPECT_EQ(analysis.issues[0].type, "syntax_error");
    EXPECT_TRUE(analysis.functions.empty());
}

TEST_F(SourceAnalysisTest, ScansScripts) {
    auto analysis = script.analyze(R"(<html><body><script>
try { run(); } catch (e) { console.error(e); }
console.log("ready"); // TODO remove
</script></body></html>)", "index.html");
    EXPECT_EQ(analysis.total_lines, 4);
    EXPECT_EQ(analysis.debug_output_count, 2);
    EXPECT_EQ(analysis.todo_count, 1);
    EXPECT_TRUE(analysis.has_error_handling);
    EXPECT_TRUE(analysis.issues.empty());
}

TEST_F(SourceAnalysisTest, WarnsOnHtmlWithoutRoot) {
    auto analysis = script.analyze("<div>fragment</div>", "index.html");
    ASSERT_EQ(analysis.issues.size(), 1u);
    EXPECT_EQ(analysis.issues[0].type, "warning");
}

TEST_F(SourceAnalysisTest, ChoosesAdapterByExtension) {
    EXPECT_NE(dynamic_cast<const python_source_adapter *>(adapter_for("app/main.py")), nullptr);
    EXPECT_NE(dynamic_cast<const script_source_adapter *>(adapter_for("index.html")), nullptr);
    EXPECT_NE(dynamic_cast<const script_source_adapter *>(adapter_for("app.js")), nullptr);
    EXPECT_EQ(adapter_for("README.md"), nullptr);
}
