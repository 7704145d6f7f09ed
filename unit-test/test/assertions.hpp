#pragma once

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "gtest/gtest.h"

/**
 * 比较 json 的断言，失败时输出两边的内容和 json patch 形式的差异
 * 响应是 CBOR 编码的，测试中先解码成 json 再比较
 */
namespace judgebox::test {

inline std::string dump_json(const nlohmann::json &j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

inline ::testing::AssertionResult json_compare(bool expect_equal,
                                               const char *lhs_expression,
                                               const char *rhs_expression,
                                               const nlohmann::json &lhs,
                                               const nlohmann::json &rhs) {
    if ((lhs == rhs) == expect_equal)
        return ::testing::AssertionSuccess();

    std::stringstream ss;
    ss << std::endl
       << "      Expected: " << lhs_expression << std::endl
       << "      Which is: " << dump_json(lhs) << std::endl
       << (expect_equal ? "To be equal to: " : "Not to be equal to: ") << rhs_expression << std::endl
       << "      Which is: " << dump_json(rhs) << std::endl;
    if (expect_equal)
        ss << "    Difference: " << dump_json(nlohmann::json::diff(lhs, rhs));
    return ::testing::AssertionFailure() << ss.str();
}

}  // namespace judgebox::test

#define EXPECT_JSON_EQ(obj1, obj2) \
    EXPECT_TRUE(judgebox::test::json_compare(true, #obj1, #obj2, obj1, obj2))

#define EXPECT_JSON_NE(obj1, obj2) \
    EXPECT_TRUE(judgebox::test::json_compare(false, #obj1, #obj2, obj1, obj2))

#define ASSERT_JSON_EQ(obj1, obj2) \
    ASSERT_TRUE(judgebox::test::json_compare(true, #obj1, #obj2, obj1, obj2))
