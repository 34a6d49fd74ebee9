#include <csignal>
#include <glog/logging.h>
#include <memory>
#include "common/python.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
public:
    void SetUp() override {
        signal(SIGPIPE, SIG_IGN);
        python_initialize("unit_test");
        // 主线程释放 GIL，之后各线程通过 GIL_guard 获取
        thread_guard = std::make_unique<PyThread_guard>();
    }

    void TearDown() override {
        thread_guard.reset();
    }

private:
    std::unique_ptr<PyThread_guard> thread_guard;
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    ::testing::AddGlobalTestEnvironment(new GlobalEnv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
