#pragma once

#include <algorithm>
#include <string>
#include <vector>

template <typename ContainerA, typename ContainerB, typename TransformFn>
void append(ContainerA &a, const ContainerB &b, TransformFn &&fn) {
    for (auto &value : b) {
        a.push_back(std::move(fn(value)));
    }
}

/**
 * @brief 字符串 s 是否以 suffix 结尾
 */
inline bool ends_with(const std::string &s, const std::string &suffix) {
    return s.length() >= suffix.length() && s.compare(s.length() - suffix.length(), suffix.length(), suffix) == 0;
}

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;
