#pragma once

#include <string>
#include <vector>
#include "toolchain/toolchain.hpp"

/**
 * 这个头文件包含所有支持的语言的工具链
 * 编译参数是固定的，属于工具链的一部分，会出现在 version() 的结果中。
 * 编译器和解释器默认在 PATH 中查找，可以通过环境变量指定：
 * PYTHON, CC, CXX, JAVA, JAVAC, JAR, RUSTC
 */
namespace judgebox {

/**
 * @brief Python 3，编译只检查语法，运行 source.py
 */
struct python3_toolchain : public toolchain {
    std::string name() const override;
    std::filesystem::path compile(work_dir &dir, const std::string &code) const override;
    std::vector<std::string> run(const std::filesystem::path &artifact) const override;
    std::string version() const override;
};

/**
 * @brief GCC 编译的 C 和 C++，两者只有编译器、源文件名、语言标准不同
 */
struct gcc_toolchain : public toolchain {
    /**
     * @param compiler_env 指定编译器的环境变量，比如 CC
     * @param default_compiler 默认编译器，比如 gcc
     * @param source_name 源文件名，比如 source.c
     * @param std_flag 语言标准参数，比如 -std=gnu2x
     */
    gcc_toolchain(const std::string &compiler_env, const std::string &default_compiler, const std::string &source_name, const std::string &std_flag);

    std::string name() const override;
    std::filesystem::path compile(work_dir &dir, const std::string &code) const override;
    std::vector<std::string> run(const std::filesystem::path &artifact) const override;
    std::string version() const override;

    std::string compiler() const;

    /**
     * @brief 出现在版本信息中的编译参数
     */
    std::vector<std::string> flags() const;

private:
    std::string compiler_env, default_compiler, source_name, std_flag;
};

/**
 * @brief Java，源代码必须是 Main 类，编译后打包为 jar.jar
 */
struct java_toolchain : public toolchain {
    std::string name() const override;
    std::filesystem::path compile(work_dir &dir, const std::string &code) const override;
    std::vector<std::string> run(const std::filesystem::path &artifact) const override;
    std::string version() const override;
};

/**
 * @brief Rust，使用 rustc 直接编译为 source
 */
struct rust_toolchain : public toolchain {
    std::string name() const override;
    std::filesystem::path compile(work_dir &dir, const std::string &code) const override;
    std::vector<std::string> run(const std::filesystem::path &artifact) const override;
    std::string version() const override;
};

/**
 * @brief 编译失败时附加在 Java 编译信息之后的提示
 */
extern const char *JAVA_HINT;

}  // namespace judgebox
