#pragma once

#include <Python.h>
#include <signal.h>
#include <string>

namespace judgebox {

/**
 * @brief 初始化内嵌的 Python 解释器
 * 自定义比较器通过内嵌的 CPython 执行，必须在加载比较器之前调用一次。
 * 重复调用没有副作用。sys.stdout 会被替换为 sys.stderr。
 * @throw internal_error 若无法替换 sys.stdout
 * @param program_name 一般为 argv[0]
 */
void init_python(const char *program_name);

/**
 * @brief 在作用域内持有 GIL
 * 评测核心是单线程的，但仍然保证每次调用 Python 代码时都持有 GIL
 */
class GIL_guard {
public:
    GIL_guard();
    ~GIL_guard();

private:
    PyGILState_STATE state;
};

/**
 * @brief 限制作用域内 Python 代码的运行时间
 * 超时后通过 SIGALRM 在解释器中注入 TimeoutError，之后每 100ms 重复注入一次，
 * 直到对象析构。只能在持有 GIL 的主线程中使用。
 * 正在执行的 C 扩展函数不会被打断，需要等它返回到解释器。
 */
class python_deadline {
public:
    /**
     * @param seconds 时间限制，不大于 0 时不限制
     * @throw std::system_error 若无法设置信号处理函数或定时器
     */
    explicit python_deadline(int seconds);
    ~python_deadline();

private:
    bool armed = false;
    struct sigaction old_action;
};

/**
 * @brief 取出并清除当前 Python 异常，格式化为 "类型名: 异常信息"
 * 调用方需要持有 GIL，且当前确实有 Python 异常
 */
std::string fetch_python_error();

}  // namespace judgebox
