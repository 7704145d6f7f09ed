#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include "common/status.hpp"
#include "judge/judger.hpp"
#include "judge/test_case.hpp"
#include "protocol/command.hpp"
#include "runguard.hpp"

namespace judgebox {

/**
 * @brief 一个测试点的评测结果，按测试点顺序出现在响应中
 */
struct pass_record {
    status kind;

    /**
     * @brief 时钟时间，单位为毫秒
     */
    int64_t time = 0;

    /**
     * @brief 扣除基准内存后的峰值常驻内存，单位为字节
     */
    int64_t memory_usage = 0;
};

/**
 * @brief { "kind": "Correct", "time": 12, "memory_usage": 1048576 }
 */
void to_json(nlohmann::json &j, const pass_record &record);

/**
 * @brief 根据运行结果判定超时、内存超限、运行时错误
 * 按顺序检查，满足第一个条件即返回
 * @param result 运行结果
 * @param memory_usage 扣除基准内存后的内存使用，单位为字节
 * @param memory_limit 内存限制，单位为 MB，为空表示不限制
 * @return 评测结果，为空表示程序正常结束，需要由比较器判断输出是否正确
 */
std::optional<status> classify(const runguard_result &result, int64_t memory_usage, const std::optional<int64_t> &memory_limit);

/**
 * @brief 运行一个测试点并判定结果
 * @param command 运行选手程序的命令
 * @param baseline 基准内存，单位为字节
 * @throw std::system_error 若选手程序无法启动
 * @throw judger_error 若比较器出错
 */
pass_record run_test_case(size_t index, const test_case &tc, const std::vector<std::string> &command, const test_command &cmd, judger &checker, int64_t baseline);

/**
 * @brief 处理 Test 命令
 * 1. 解析测试数据
 * 2. 加载比较器，比较器有问题时不必浪费时间编译
 * 3. 编译选手程序
 * 4. 测量基准内存
 * 5. 依次运行每个测试点
 * 编译失败、比较器出错、选手程序无法启动都会中止评测，返回 { "InvalidProgram": 原因 }
 * @return { "Ok": [pass_record...] } 或者 { "InvalidProgram": 原因 }
 */
nlohmann::json run_tests(const test_command &cmd);

}  // namespace judgebox
