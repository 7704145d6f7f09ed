#pragma once

#include <boost/python.hpp>
#include <memory>
#include <optional>
#include <string>

namespace judgebox {

/**
 * @brief 比较选手程序的输出和期望输出
 */
struct judger {
    virtual ~judger() = default;

    /**
     * @brief 判断一个测试点的输出是否正确
     * @param index 测试点编号，从 0 开始
     * @param input 喂给选手程序的输入
     * @param expected_output 去掉首尾空白的期望输出
     * @param actual_output 去掉首尾空白的实际输出
     * @return true 若输出正确
     * @throw judger_error 若比较器本身出错，整个评测请求将被中止
     */
    virtual bool judge(size_t index, const std::string &input, const std::string &expected_output, const std::string &actual_output) = 0;
};

/**
 * @brief 默认比较器，输出完全一致才算正确
 */
struct exact_judger : public judger {
    bool judge(size_t index, const std::string &input, const std::string &expected_output, const std::string &actual_output) override;
};

/**
 * @brief 通过内嵌的 Python 解释器运行的自定义比较器
 * 比较器源代码必须定义函数：
 * @code{.py}
 *     def judge(index: int, input: str, expected_output: str, actual_output: str) -> bool:
 *         ...
 * @endcode
 * 每个评测请求都重新加载，源代码在一个只有 __builtins__ 和 __name__ 的全新命名空间中执行。
 */
class python_judger : public judger {
public:
    /**
     * @brief 执行比较器源代码并取出 judge 函数
     * @throw judger_error 若源代码执行出错，或者没有定义可调用的 judge
     */
    static std::unique_ptr<python_judger> load(const std::string &source);

    ~python_judger() override;

    /**
     * @throw judger_error 若 judge 抛出异常或者返回值不是 bool
     */
    bool judge(size_t index, const std::string &input, const std::string &expected_output, const std::string &actual_output) override;

    /**
     * @brief 检查 judge 能否接受四个参数，并用占位参数调用一次
     * @throw judger_error 若检查失败
     */
    void validate();

private:
    python_judger(const boost::python::object &module_namespace, const boost::python::object &judge_function);

    boost::python::object module_namespace;
    boost::python::object judge_function;
};

/**
 * @brief 根据命令选择比较器
 * @param source 自定义比较器源代码，为空或者空字符串时使用 exact_judger
 * @throw judger_error 若自定义比较器无法加载
 */
std::unique_ptr<judger> make_judger(const std::optional<std::string> &source);

/**
 * @brief 检查自定义比较器
 * @return 检查失败的原因，检查通过时为空
 */
std::optional<std::string> validate_judger(const std::string &source);

}  // namespace judgebox
