#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace judgebox {

struct judgebox_exception : std::exception {
    judgebox_exception();
    explicit judgebox_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judgebox_exception &ex);

    template <typename T>
    judgebox_exception operator<<(const T &t) const {
        return judgebox_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测核心的内部错误
 * 一般是工具链本身的问题，比如编译器不存在、版本查询失败
 */
struct internal_error : public judgebox_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示选手程序不合法
 * 编译失败、编译超时都会抛出该异常，整个评测请求会被中止，
 * 异常信息（包含编译命令和编译器输出）将原样返回给调用方
 */
struct invalid_program : public judgebox_exception {
    invalid_program();
    explicit invalid_program(const std::string &message);
};

/**
 * @brief 表示自定义比较器出错
 * 包括比较器加载失败、缺少 judge 函数、调用时抛出异常、返回值不是 bool
 */
struct judger_error : public judgebox_exception {
    judger_error();
    explicit judger_error(const std::string &message);
};

/**
 * @brief 表示输入的命令格式错误，无法解码
 */
struct protocol_error : public judgebox_exception {
    protocol_error();
    explicit protocol_error(const std::string &message);
};

}  // namespace judgebox
