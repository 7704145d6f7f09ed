#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include "toolchain/toolchain.hpp"

namespace judgebox {

/**
 * @brief 编译选手程序并运行所有测试点
 */
struct test_command {
    language lang;

    /**
     * @brief 选手的源代码，命令中可以是文本也可以是字节串
     */
    std::string code;

    /**
     * @brief 未解析的测试数据，格式参见 parse_tests
     */
    std::string tests;

    /**
     * @brief 每个测试点的时钟时间限制，单位为毫秒，不超过 UINT32_MAX
     */
    int64_t time_limit;

    /**
     * @brief 内存限制，单位为 MB，不超过 UINT32_MAX，为空时只统计内存不判定内存超限
     */
    std::optional<int64_t> memory_limit;

    /**
     * @brief 自定义比较器的 Python 源代码，为空时使用默认比较器
     */
    std::optional<std::string> custom_judger;
};

/**
 * @brief 查询所有工具链的版本
 */
struct versions_command {};

/**
 * @brief 检查自定义比较器是否能够加载和调用
 */
struct validate_judger_command {
    std::string judger;
};

typedef std::variant<test_command, versions_command, validate_judger_command> command;

/**
 * @brief 从解码后的 CBOR 数据中解析命令
 * 命令是一个 map，command 字段为命令类型，其他字段与 command 字段平级：
 * { "command": "Test", "language": 2, "code": "...", "tests": "...", "time_limit": 1000, "memory_limit": 256 }
 * { "command": "Versions" }
 * { "command": "ValidateJudger", "judger": "..." }
 * @throw protocol_error 若命令类型未知、缺少字段或者字段类型错误
 */
command parse_command(const nlohmann::json &j);

/**
 * @brief 读取命令文件并删除，再解码命令
 * 命令文件只能被消费一次，即使解码失败也会被删除
 * @throw std::system_error 若命令文件无法读取
 * @throw protocol_error 若命令无法解码
 */
command read_command(const std::filesystem::path &path);

}  // namespace judgebox
