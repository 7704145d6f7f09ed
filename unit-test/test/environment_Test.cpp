#include "test/environment.hpp"
#include <stdlib.h>
#include <system_error>
#include "common/utils.hpp"
#include "config.hpp"

namespace judgebox::test {
using namespace std;

bool has_program(const string &name) {
    return !find_executable(name).empty();
}

scoped_env::scoped_env(const string &key, const string &value) : key(key) {
    if (const char *old = getenv(key.c_str())) old_value = old;
    set_env(key, value);
}

scoped_env::~scoped_env() {
    if (old_value)
        set_env(key, *old_value);
    else
        unsetenv(key.c_str());
}

scoped_work_dir::scoped_work_dir() : old_work_dir(WORK_DIR) {
    string pattern = (filesystem::temp_directory_path() / "judgebox-XXXXXX").string();
    if (!mkdtemp(pattern.data()))
        throw system_error(errno, system_category(), "mkdtemp");
    dir = pattern;
    WORK_DIR = dir;
}

scoped_work_dir::~scoped_work_dir() {
    WORK_DIR = old_work_dir;
    error_code ec;
    filesystem::remove_all(dir, ec);
}

const filesystem::path &scoped_work_dir::path() const {
    return dir;
}

}  // namespace judgebox::test
