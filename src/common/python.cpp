#include "common/python.hpp"
#include <boost/python.hpp>
#include <fmt/core.h>
#include <glog/logging.h>
#include <sys/time.h>
#include <cerrno>
#include <cstring>
#include <system_error>
#include "common/exceptions.hpp"

namespace judgebox {
using namespace std;
namespace bp = boost::python;

void init_python(const char *program_name) {
    if (Py_IsInitialized()) return;

    wchar_t *progname = Py_DecodeLocale(program_name, nullptr);
    if (progname) Py_SetProgramName(progname);
    Py_InitializeEx(0);  // 不注册 Python 的信号处理函数
    LOG(INFO) << "embedded Python " << Py_GetVersion();

    // stdout 只能输出 CBOR 响应，比较器的 print 全部转到 stderr
    GIL_guard guard;
    try {
        bp::object sys = bp::import("sys");
        sys.attr("stdout") = sys.attr("stderr");
        sys.attr("__stdout__") = sys.attr("stderr");
    } catch (bp::error_already_set &) {
        throw internal_error("Unable to redirect Python stdout: " + fetch_python_error());
    }
}

GIL_guard::GIL_guard() {
    state = PyGILState_Ensure();
}

GIL_guard::~GIL_guard() {
    PyGILState_Release(state);
}

static volatile sig_atomic_t deadline_armed = 0;
static int deadline_seconds = 0;

static void set_timer(long sec, long usec) {
    struct itimerval timer;
    memset(&timer, 0, sizeof(timer));
    timer.it_value.tv_sec = sec;
    timer.it_value.tv_usec = usec;
    if (setitimer(ITIMER_REAL, &timer, nullptr) != 0)
        throw system_error(errno, generic_category(), "setitimer");
}

// 由解释器在主线程中执行，此时已经持有 GIL
static int raise_deadline_exceeded(void *) {
    if (!deadline_armed) return 0;
    // 比较器捕获了上一次的 TimeoutError，100ms 后再注入一次
    struct itimerval timer;
    memset(&timer, 0, sizeof(timer));
    timer.it_value.tv_usec = 100000;
    if (setitimer(ITIMER_REAL, &timer, nullptr) != 0)
        LOG(WARNING) << "unable to re-arm judger timer: " << strerror(errno);
    PyErr_SetString(PyExc_TimeoutError, fmt::format("judger exceeded its time limit of {} seconds", deadline_seconds).c_str());
    return -1;
}

static void deadline_handler(int) {
    if (deadline_armed) Py_AddPendingCall(raise_deadline_exceeded, nullptr);
}

python_deadline::python_deadline(int seconds) {
    if (seconds <= 0) return;

    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = deadline_handler;
    sigemptyset(&sa.sa_mask);
    if (sigaction(SIGALRM, &sa, &old_action) != 0)
        throw system_error(errno, generic_category(), "installing SIGALRM handler");

    deadline_seconds = seconds;
    deadline_armed = 1;
    armed = true;
    try {
        set_timer(seconds, 0);
    } catch (system_error &) {
        deadline_armed = 0;
        sigaction(SIGALRM, &old_action, nullptr);
        throw;
    }
}

python_deadline::~python_deadline() {
    if (!armed) return;
    deadline_armed = 0;

    struct itimerval timer;
    memset(&timer, 0, sizeof(timer));
    if (setitimer(ITIMER_REAL, &timer, nullptr) != 0)
        LOG(WARNING) << "unable to cancel judger timer: " << strerror(errno);
    if (sigaction(SIGALRM, &old_action, nullptr) != 0)
        LOG(WARNING) << "unable to restore SIGALRM handler: " << strerror(errno);
}

string fetch_python_error() {
    PyObject *type = nullptr, *value = nullptr, *traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    if (!type) return "unknown Python error";
    PyErr_NormalizeException(&type, &value, &traceback);

    bp::handle<> htype(bp::allow_null(type));
    bp::handle<> hvalue(bp::allow_null(value));
    bp::handle<> htraceback(bp::allow_null(traceback));

    string type_name = reinterpret_cast<PyTypeObject *>(htype.get())->tp_name;
    if (!hvalue) return type_name;

    PyObject *str = PyObject_Str(hvalue.get());
    if (!str) {
        PyErr_Clear();
        return type_name;
    }
    bp::handle<> hstr(str);
    const char *message = PyUnicode_AsUTF8(hstr.get());
    if (!message) {
        PyErr_Clear();
        return type_name;
    }
    if (*message == '\0') return type_name;
    return fmt::format("{}: {}", type_name, message);
}

}  // namespace judgebox
