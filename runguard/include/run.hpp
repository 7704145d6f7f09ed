#pragma once

#include <cstdint>
#include <string>
#include "runguard_options.hpp"

struct runguard_result {
    std::string stdout_data;
    std::string stderr_data;

    /**
     * @brief 子进程的退出码
     * 若子进程被信号终止，为 128 + 信号编号
     */
    int exitcode = -1;

    /**
     * @brief 终止子进程的信号，-1 表示正常退出
     */
    int signal = -1;

    /**
     * @brief 子进程是否因为超出时钟时间限制被终止
     */
    bool timed_out = false;

    /**
     * @brief 时钟时间，单位为秒
     * 包括创建进程、传输输入输出、等待进程结束的全部时间
     */
    double wall_time = 0;

    /**
     * @brief 峰值常驻内存（单位为字节）
     * 由 wait4 返回的 rusage 得到，是内核统计的准确值而不是采样值。
     * 包括 fork 出来、还未 exec 的进程本身的内存，因此需要扣除基准内存
     */
    int64_t memory = 0;

    size_t stdin_bytes = 0;
    size_t stdout_bytes = 0;
    size_t stderr_bytes = 0;
};

/**
 * @brief 根据传入的设置运行指定的程序，并等待程序结束
 * 1. 创建连接子进程 stdin/stdout/stderr 的管道，以及一个 close-on-exec 的错误管道
 * 2. 调用 fork 创建子进程
 *    1. 对于子进程
 *       1. 恢复信号处理和信号掩码
 *       2. 将管道重定向到 stdin/stdout/stderr
 *       3. 分离到一个独立的进程组，以便我们通过 SIGKILL 可以杀死进程组内所有进程
 *       4. 设置工作路径和 rlimit
 *       5. 调用 execvp，失败时通过错误管道将 errno 告知父进程
 *    2. 对于父进程
 *       1. 检查错误管道，若子进程没能启动则抛出 std::system_error
 *       2. 通过 ppoll 写入 stdin、读取 stdout/stderr，直到子进程结束或者超时
 *       3. 超时时先发送 SIGTERM，0.1 秒后发送 SIGKILL 给整个进程组
 * 3. 通过 wait4 回收子进程，读取峰值常驻内存
 * @note 超时、非零退出码、被信号终止都是正常的运行结果，不会抛出异常
 * @throw std::system_error 若无法创建子进程
 */
runguard_result runit(const runguard_options &opt);
