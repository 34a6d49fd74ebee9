#include "config.hpp"

namespace vibe {
using namespace std;

double SANDBOX_TIME_LIMIT = 60;
double VALIDATION_TIME_LIMIT = 30;
double TEST_TIME_LIMIT = 30;
int PAGE_LOAD_TIMEOUT = 10000;  // 10s
int PAGE_SETTLE_TIME = 200;     // 200ms
size_t MAX_OUTPUT_CHARS = 10000;
size_t REPORT_OUTPUT_CHARS = 5000;
double JUDGE_TIME_LIMIT = 120;
double DISAGREEMENT_THRESHOLD = 15;
string PYTHON_EXECUTABLE = "python3";
string CHROME_PATH;
bool DEBUG = false;

}  // namespace vibe
