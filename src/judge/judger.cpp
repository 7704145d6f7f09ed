#include "judge/judger.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/python.hpp"
#include "config.hpp"

namespace judgebox {
using namespace std;
namespace bp = boost::python;

bool exact_judger::judge(size_t, const string &, const string &expected_output, const string &actual_output) {
    return expected_output == actual_output;
}

/**
 * @brief 将 UTF-8 字符串转换为 Python 的 str
 * @throw judger_error 若字符串不是合法的 UTF-8
 */
static bp::str to_python_str(const string &text, const char *what) {
    try {
        return bp::str(text.data(), text.size());
    } catch (bp::error_already_set &) {
        throw judger_error(fmt::format("{} cannot be passed to judger: {}", what, fetch_python_error()));
    }
}

python_judger::python_judger(const bp::object &module_namespace, const bp::object &judge_function)
    : module_namespace(module_namespace), judge_function(judge_function) {}

python_judger::~python_judger() {
    GIL_guard guard;
    judge_function = bp::object();
    module_namespace = bp::object();
}

unique_ptr<python_judger> python_judger::load(const string &source) {
    GIL_guard guard;

    bp::dict ns;
    bp::object judge_function;
    try {
        python_deadline deadline(JUDGER_TIME_LIMIT);
        ns["__builtins__"] = bp::import("builtins");
        ns["__name__"] = "judger";
        bp::exec(to_python_str(source, "judger source"), ns, ns);

        if (!ns.has_key("judge"))
            throw judger_error("judger does not define a judge function");
        judge_function = ns["judge"];
    } catch (bp::error_already_set &) {
        throw judger_error(fetch_python_error());
    } catch (system_error &e) {
        throw judger_error(fmt::format("Unable to limit judger time: {}", e.what()));
    }

    if (!PyCallable_Check(judge_function.ptr()))
        throw judger_error(fmt::format("judge is not callable, it is a {}", Py_TYPE(judge_function.ptr())->tp_name));

    return unique_ptr<python_judger>(new python_judger(ns, judge_function));
}

bool python_judger::judge(size_t index, const string &input, const string &expected_output, const string &actual_output) {
    GIL_guard guard;

    bp::str py_input = to_python_str(input, "input");
    bp::str py_expected = to_python_str(expected_output, "expected output");
    bp::str py_actual = to_python_str(actual_output, "actual output");

    bp::object result;
    try {
        python_deadline deadline(JUDGER_TIME_LIMIT);
        result = judge_function(index, py_input, py_expected, py_actual);
    } catch (bp::error_already_set &) {
        throw judger_error("judger raised an exception: " + fetch_python_error());
    } catch (system_error &e) {
        throw judger_error(fmt::format("Unable to limit judger time: {}", e.what()));
    }

    if (!PyBool_Check(result.ptr()))
        throw judger_error(fmt::format("judger returned {} instead of bool", Py_TYPE(result.ptr())->tp_name));
    return result.ptr() == Py_True;
}

void python_judger::validate() {
    {
        GIL_guard guard;
        try {
            python_deadline deadline(JUDGER_TIME_LIMIT);
            bp::object inspect = bp::import("inspect");
            inspect.attr("signature")(judge_function).attr("bind")(0, "0\n", "0", "0");
        } catch (bp::error_already_set &) {
            throw judger_error(fetch_python_error());
        } catch (system_error &e) {
            throw judger_error(fmt::format("Unable to limit judger time: {}", e.what()));
        }
    }

    judge(0, "0\n", "0", "0");
}

unique_ptr<judger> make_judger(const optional<string> &source) {
    if (!source || source->empty())
        return make_unique<exact_judger>();
    LOG(INFO) << "Loading custom judger";
    return python_judger::load(*source);
}

optional<string> validate_judger(const string &source) {
    try {
        auto judger = python_judger::load(source);
        judger->validate();
    } catch (judger_error &e) {
        LOG(INFO) << "Judger rejected: " << e.what();
        return string(e.what());
    }
    return nullopt;
}

}  // namespace judgebox
