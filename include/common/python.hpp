#pragma once

#include <Python.h>
#include <string>

/**
 * @brief 在当前线程持有 GIL，析构时释放
 * 所有调用嵌入式 Python 解释器的地方都需要持有 GIL
 */
class GIL_guard {
public:
    GIL_guard();
    ~GIL_guard();

private:
    PyGILState_STATE state;
};

/**
 * @brief 在主线程释放 GIL，析构时重新获取
 * 主线程初始化解释器以后需要释放 GIL，其他线程才能执行 Python 代码
 */
class PyThread_guard {
public:
    PyThread_guard();
    ~PyThread_guard();

private:
    PyThreadState *state;
};

/**
 * @brief 初始化嵌入式 Python 解释器，可重复调用
 */
void python_initialize(const char *program_name);

/**
 * @brief 取出当前的 Python 异常并转换为字符串，同时清除异常状态
 * 必须在持有 GIL 时调用
 */
std::string fetch_python_error();
