#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "run.hpp"

namespace judgebox {

/**
 * @brief 运行选手程序
 * stdout 和 stderr 分开收集，各自最多保留 OUTPUT_LIMIT KB
 * @param command 运行命令，比如 {"./source"}
 * @param work_dir 子进程的工作目录
 * @param input 喂给子进程 stdin 的数据
 * @param wall_limit 时钟时间限制，单位为毫秒
 * @throw std::system_error 若无法启动子进程
 */
runguard_result run_program(const std::vector<std::string> &command, const std::filesystem::path &work_dir, const std::string &input, int64_t wall_limit);

/**
 * @brief 运行编译器等工具，stdin 为空
 * @param work_dir 子进程的工作目录，为空时继承当前工作目录
 * @param time_limit 时钟时间限制，单位为秒
 * @param merge_stderr 是否将 stderr 合并到 stdout，编译命令需要完整的输出
 * @throw std::system_error 若无法启动子进程
 */
runguard_result run_tool(const std::vector<std::string> &command, const std::filesystem::path &work_dir, int time_limit, bool merge_stderr = true);

/**
 * @brief 测量基准内存
 * 运行 iterations 次 true 命令，取峰值常驻内存的平均值。
 * 这部分内存是 fork 出来的进程在 exec 之前就已占用的，不属于选手程序。
 * @return 基准内存，单位为字节
 */
int64_t calibrate_baseline(int iterations);

/**
 * @brief 扣除基准内存后的内存使用，不会小于 0
 */
int64_t adjusted_memory(int64_t raw, int64_t baseline);

}  // namespace judgebox
