#pragma once

#include <string>
#include <vector>

namespace judgebox {

/**
 * @brief 一个测试点，两个字段都已经去掉了首尾空白
 */
struct test_case {
    std::string input;
    std::string expected_output;
};

/**
 * @brief 解析测试数据
 * 测试点之间以单独一行 === 分隔，测试点内部以第一个单独一行的 -- 分隔输入和期望输出：
 * @code
 *     1 2
 *     --
 *     3
 *     ===
 *     4 5
 *     --
 *     9
 * @endcode
 * 没有 -- 的测试点只有输入，期望输出为空。
 */
std::vector<test_case> parse_tests(const std::string &raw);

/**
 * @brief 喂给选手程序的输入：去掉首尾空白，再以恰好一个换行结尾
 */
std::string normalize_input(const std::string &input);

}  // namespace judgebox
