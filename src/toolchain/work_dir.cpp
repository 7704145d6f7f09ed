#include "toolchain/work_dir.hpp"
#include <glog/logging.h>
#include <algorithm>
#include "common/io_utils.hpp"
#include "config.hpp"

namespace judgebox {
using namespace std;

work_dir::work_dir(const filesystem::path &root) : root_dir(filesystem::absolute(root)) {
    filesystem::create_directories(root_dir);
}

work_dir::~work_dir() {
    if (DEBUG) {
        LOG(INFO) << "Keeping " << created.size() << " artifacts in " << root_dir;
        return;
    }

    for (auto it = created.rbegin(); it != created.rend(); ++it) {
        error_code ec;
        filesystem::remove_all(*it, ec);
        if (ec) LOG(WARNING) << "Unable to remove " << *it << ": " << ec.message();
    }
}

const filesystem::path &work_dir::root() const {
    return root_dir;
}

filesystem::path work_dir::write(const string &name, const string &contents) {
    filesystem::path path = artifact(name);
    write_file_content(path, contents);
    return path;
}

filesystem::path work_dir::artifact(const string &name) {
    filesystem::path path = root_dir / assert_safe_path(name);
    if (find(created.begin(), created.end(), path) == created.end())
        created.push_back(path);
    return path;
}

const vector<filesystem::path> &work_dir::artifacts() const {
    return created;
}

}  // namespace judgebox
