#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "toolchain/work_dir.hpp"

namespace judgebox {

/**
 * @brief 支持的编程语言
 * 枚举值即命令中 language 字段的取值，顺序不能改变
 */
enum class language : uint8_t {
    PYTHON3 = 0,
    C = 1,
    CPP = 2,
    JAVA = 3,
    RUST = 4
};

/**
 * @brief 将命令中的语言编号转换为 language
 * @throw protocol_error 若编号不对应任何语言
 */
language language_from_ordinal(int64_t ordinal);

/**
 * @brief 按语言编号顺序返回所有语言
 */
const std::vector<language> &all_languages();

/**
 * @brief 表示一种语言的工具链
 * 工具链没有状态，负责把源代码编译成可以运行的产物，
 * 并给出运行产物的命令。
 */
struct toolchain {
    virtual ~toolchain() = default;

    /**
     * @brief 工具链的名称，用于日志
     */
    virtual std::string name() const = 0;

    /**
     * @brief 将源代码写入工作目录并编译
     * @param dir 工作目录，源代码和编译产物都会登记在这里，由 dir 负责删除
     * @param code 选手的源代码
     * @return 编译产物的绝对路径，传给 run 使用
     * @throw invalid_program 若编译失败或超时
     */
    virtual std::filesystem::path compile(work_dir &dir, const std::string &code) const = 0;

    /**
     * @brief 运行编译产物的命令，子进程的工作目录为评测的工作目录
     */
    virtual std::vector<std::string> run(const std::filesystem::path &artifact) const = 0;

    /**
     * @brief 工具链的版本信息，包括编译参数
     * @throw std::system_error 若版本查询命令无法启动
     * @throw internal_error 若版本查询命令失败
     */
    virtual std::string version() const = 0;
};

/**
 * @brief 获得语言对应的工具链，工具链在整个进程中只有一个实例
 */
const toolchain &get_toolchain(language lang);

/**
 * @brief 在工作目录中运行一条编译命令
 * 编译命令的 stdout 和 stderr 会合并收集，超过 COMPILATION_TIME_LIMIT 秒将被终止
 * @param hint 编译失败时附加在错误信息末尾的提示
 * @throw invalid_program 若编译命令无法启动、退出码不为 0 或者超时，
 *        信息为 "While running <命令>:\n\n<编译输出><hint>"
 */
void compile_run(const work_dir &dir, const std::vector<std::string> &command, const std::string &hint = "");

/**
 * @brief 运行版本查询命令并返回 stdout，超过 VERSION_TIME_LIMIT 秒将被终止
 * @throw std::system_error 若命令无法启动
 * @throw internal_error 若命令退出码不为 0 或者超时
 */
std::string query_version(const std::vector<std::string> &command);

}  // namespace judgebox
