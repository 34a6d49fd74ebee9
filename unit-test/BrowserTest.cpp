#include <memory>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "sandbox/validator.hpp"
#include "test/workspace.hpp"

using namespace std;
using namespace vibe;

/**
 * @brief 需要本机安装 Chromium，没有浏览器时跳过
 */
class BrowserTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        pool = make_unique<browser_pool>();
    }

    static void TearDownTestCase() {
        pool.reset();
    }

    void SetUp() override {
        if (!pool->available()) GTEST_SKIP() << "Headless browser not available";
    }

    unique_ptr<browser_page> open(const string &html) {
        auto file = ws.write("index.html", html);
        auto page = pool->acquire_page();
        page->set_default_timeout(10000);
        page->navigate(file_url(file), PAGE_LOAD_TIMEOUT);
        page->wait_for_timeout(100);
        return page;
    }

    static unique_ptr<browser_pool> pool;
    temp_workspace ws;
};

unique_ptr<browser_pool> BrowserTest::pool;

TEST_F(BrowserTest, QueriesElements) {
    auto page = open(R"(<html><body>
<button>1</button><button>2</button><button class="op">+</button>
<div id="display">0</div>
</body></html>)");
    EXPECT_EQ(page->count("button"), 3);
    EXPECT_EQ(page->count("button", "+"), 1);
    EXPECT_EQ(page->count("table"), 0);
    EXPECT_EQ(page->text_content("#display"), "0");
    EXPECT_THROW(page->text_content("#missing"), browser_error);
    EXPECT_EQ(page->evaluate("1 + 2"), 3);
}

TEST_F(BrowserTest, ClicksAndFills) {
    auto page = open(R"(<html><body>
<input id="name"><button onclick="document.getElementById('out').textContent = 'Hi ' + document.getElementById('name').value">Go</button>
<p id="out"></p>
</body></html>)");
    page->fill("#name", "Ada");
    page->click("button", "Go");
    EXPECT_EQ(page->text_content("#out"), "Hi Ada");
    EXPECT_THROW(page->click("button", "Stop"), browser_error);
}

TEST_F(BrowserTest, CollectsPageErrors) {
    auto page = open(R"(<html><body><script>
console.error('bad thing');
undefinedFunction();
</script></body></html>)");
    auto errors = page->errors();
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0].rfind("Console error: ", 0), 0u);
    EXPECT_EQ(errors[1].rfind("JS Error: ", 0), 0u);

    page->clear_errors();
    EXPECT_TRUE(page->errors().empty());
}

TEST_F(BrowserTest, ValidatesHtmlInBrowser) {
    execution_validator validator(*pool);
    ws.write("index.html", "<html><body><h1>ok</h1></body></html>");
    auto report = validator.validate(ws.path());
    EXPECT_TRUE(report.executed);
    EXPECT_TRUE(report.errors.empty());
    EXPECT_TRUE(report.screenshot);

    ws.write("index.html", "<html><body><script>throw new Error('broken')</script></body></html>");
    report = validator.validate(ws.path());
    EXPECT_FALSE(report.executed);
    EXPECT_EQ(report.exit_code, 1);
    EXPECT_FALSE(report.errors.empty());
}
