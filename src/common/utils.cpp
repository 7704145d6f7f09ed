#include "common/utils.hpp"
#include <unistd.h>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <cstdlib>

namespace judgebox {
using namespace std;

string format_command(const vector<string> &args) {
    string result = "[";
    for (size_t i = 0; i < args.size(); ++i) {
        if (i) result += ", ";
        result += '\'';
        for (char c : args[i]) {
            if (c == '\'' || c == '\\') result += '\\';
            result += c;
        }
        result += '\'';
    }
    result += "]";
    return result;
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

filesystem::path find_executable(const string &name) {
    if (name.empty()) return {};
    if (name.find('/') != string::npos)
        return access(name.c_str(), X_OK) == 0 ? filesystem::path(name) : filesystem::path();

    vector<string> dirs;
    string path = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    boost::split(dirs, path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        filesystem::path candidate = filesystem::path(dir.empty() ? "." : dir) / name;
        if (access(candidate.c_str(), X_OK) == 0)
            return candidate;
    }
    return {};
}

}  // namespace judgebox
