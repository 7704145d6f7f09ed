#pragma once

#include <cstdint>
#include <filesystem>

namespace judgebox {

/**
 * @brief 命令文件的路径，读取后立即删除
 * 外部监督程序在启动评测核心之前将命令写入该文件
 * @defaultValue 工作目录下的 command 文件
 */
extern std::filesystem::path COMMAND_PATH;

/**
 * @brief 选手程序编译及运行的工作目录
 * 该目录由本进程独占，源代码和编译产物使用固定的文件名：
 *
 * WORK_DIR
 * ├── command // 命令文件，读取后删除
 * ├── source.py // Python 3 源代码
 * ├── source.c // C 源代码
 * ├── source.cpp // C++ 源代码
 * ├── source.rs // Rust 源代码
 * ├── source // C/C++/Rust 编译产生的可执行文件
 * ├── Main.java // Java 源代码
 * ├── classes // javac 输出的 class 文件
 * └── jar.jar // 打包好的 Java 程序
 *
 * @defaultValue 当前工作目录
 */
extern std::filesystem::path WORK_DIR;

/**
 * @brief 编译命令的时钟时间限制，单位为秒
 */
extern int COMPILATION_TIME_LIMIT;

/**
 * @brief 查询工具链版本的时钟时间限制，单位为秒
 */
extern int VERSION_TIME_LIMIT;

/**
 * @brief 自定义比较器单次加载或调用的时钟时间限制，单位为秒
 * 不大于 0 时不限制
 */
extern int JUDGER_TIME_LIMIT;

/**
 * @brief 测量基准内存时运行空命令的次数
 */
extern int BASELINE_ITERATIONS;

/**
 * @brief 选手程序 stdout 和 stderr 各自最多保留多少数据，单位为 KB
 * 超出部分会被读出并丢弃
 */
extern int64_t OUTPUT_LIMIT;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测核心不会删除工作目录中的源代码和编译产物，
 * 以便手动检查编译结果。
 */
extern bool DEBUG;

}  // namespace judgebox
