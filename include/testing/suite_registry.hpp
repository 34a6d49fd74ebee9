#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "testing/test_suite.hpp"

namespace vibe {

using suite_factory = std::function<test_suite()>;

/**
 * @brief 按用例名注册的编译期测试集
 */
class suite_registry {
public:
    /**
     * @brief 注册测试集，同名的注册会覆盖之前的
     */
    suite_registry &add(const std::string &case_name, suite_factory factory);

    std::optional<test_suite> find(const std::string &case_name) const;

    bool contains(const std::string &case_name) const;

    std::vector<std::string> names() const;

    /**
     * @brief 包含内置用例 case_03_calculator 与 case_16_repostats 的注册表
     */
    static suite_registry with_builtin_suites();

private:
    std::map<std::string, suite_factory> factories;
};

test_suite calculator_suite();

test_suite repostats_suite();

/**
 * @brief 解析用例目录对应的测试集
 * 优先使用目录下的 tests.json，其次使用以目录名注册的测试集
 * @return 没有任何测试来源时返回 nullopt
 * @throw std::invalid_argument tests.json 格式不正确
 */
std::optional<test_suite> resolve_suite(const std::filesystem::path &case_dir, const suite_registry &registry);

}  // namespace vibe
