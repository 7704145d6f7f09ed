#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct runguard_options {
    /**
     * @brief 子进程的工作目录，为空时继承当前工作目录
     */
    std::string work_dir;

    bool use_wall_limit = false;
    double wall_limit = 0;  // wall clock time in seconds

    /**
     * @brief 地址空间限制（RLIMIT_AS），单位为字节，小于 0 表示不限制
     * 评测结果不依赖这个限制，内存超限由 rusage 的峰值常驻内存判断
     */
    int64_t memory_limit = -1;
    int64_t file_limit = -1;   // Output file size limit in bytes
    int64_t stream_size = -1;  // Bytes of stdout/stderr kept, the rest is discarded
    bool no_core_dumps = true;

    /**
     * @brief 是否将 stderr 合并到 stdout 中
     * 编译命令需要合并输出，以便将完整的编译信息返回给调用方
     */
    bool merge_stderr = false;

    /**
     * @brief 喂给子进程 stdin 的数据
     */
    std::string stdin_data;

    std::vector<std::string> env;
    std::vector<std::string> command;
};
