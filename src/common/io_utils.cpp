#include "common/io_utils.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace judgebox {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const filesystem::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to create file " + path.string());
    fout.write(content.data(), content.size());
    if (!fout)
        throw system_error(errno, system_category(), "unable to write file " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("..") != string::npos || (!subpath.empty() && subpath[0] == '/'))
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

}  // namespace judgebox
