#include "limits.hpp"
#include <fmt/core.h>
#include <sys/resource.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <system_error>

using namespace std;

void set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0)
        throw system_error(errno, generic_category(), "setrlimit");
}

void set_restrictions(const struct runguard_options &opt) {
    for (auto &entry : opt.env) {
        auto idx = entry.find('=');
        if (idx == string::npos) continue;
        setenv(entry.substr(0, idx).c_str(), entry.substr(idx + 1).c_str(), true);
    }

    if (opt.memory_limit > 0)
        set_rlimit(RLIMIT_AS, opt.memory_limit, opt.memory_limit);

    // raise the soft stack limit as far as we are allowed to
    struct rlimit stack;
    if (getrlimit(RLIMIT_STACK, &stack) == 0 && stack.rlim_cur != stack.rlim_max)
        set_rlimit(RLIMIT_STACK, stack.rlim_max, stack.rlim_max);

    if (opt.file_limit > 0) set_rlimit(RLIMIT_FSIZE, opt.file_limit, opt.file_limit);
    if (opt.no_core_dumps) set_rlimit(RLIMIT_CORE, 0, 0);

    // run the command in a separate process group,
    // so the command and all its child processes can be killed
    // off with one signal
    if (setsid() == -1)
        throw system_error(errno, generic_category(), "unable to setsid");

    if (!opt.work_dir.empty()) {
        if (chdir(opt.work_dir.c_str()) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to chdir to {}", opt.work_dir));
    }
}
