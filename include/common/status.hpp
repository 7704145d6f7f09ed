#pragma once

namespace judgebox {

/**
 * @brief 表示一个测试点的评测结果
 * 多个条件同时成立时，按照枚举声明的顺序取第一个：
 * 超时和内存超限先于退出码检查，因为被强制终止的程序退出码也不为 0；
 * 退出码检查先于输出比较。
 */
enum class status {
    /**
     * @brief 用户程序运行时间超出限制
     * 比较的是时钟时间，超时的程序会被强制终止
     */
    TIME_LIMIT_EXCEEDED = 0,

    /**
     * @brief 用户程序运行内存超限
     * 比较的是扣除基准内存之后的峰值常驻内存，即使程序正常退出也会判为内存超限
     */
    MEMORY_LIMIT_EXCEEDED = 1,

    /**
     * @brief 用户程序出现运行时错误
     * 退出码不为 0，或者被信号终止
     */
    RUNTIME_ERROR = 2,

    /**
     * @brief 用户程序本测试点评测通过
     */
    CORRECT = 3,

    /**
     * @brief 答案错误
     */
    WRONG = 4
};

/**
 * @brief 评测结果在响应中的名称，比如 "TimeLimitExceeded"
 */
const char *get_wire_name(status);

/**
 * @brief 评测结果的可读名称，用于日志
 */
const char *get_display_message(status);

}  // namespace judgebox
