#include "runguard.hpp"
#include <glog/logging.h>
#include <algorithm>
#include "config.hpp"

namespace judgebox {
using namespace std;

runguard_result run_program(const vector<string> &command, const filesystem::path &work_dir, const string &input, int64_t wall_limit) {
    runguard_options opt;
    opt.command = command;
    opt.work_dir = work_dir.string();
    opt.stdin_data = input;
    opt.use_wall_limit = true;
    opt.wall_limit = wall_limit / 1000.0;
    opt.stream_size = OUTPUT_LIMIT * 1024;
    return runit(opt);
}

runguard_result run_tool(const vector<string> &command, const filesystem::path &work_dir, int time_limit, bool merge_stderr) {
    runguard_options opt;
    opt.command = command;
    opt.work_dir = work_dir.string();
    opt.use_wall_limit = true;
    opt.wall_limit = time_limit;
    opt.merge_stderr = merge_stderr;
    opt.stream_size = OUTPUT_LIMIT * 1024;
    return runit(opt);
}

int64_t calibrate_baseline(int iterations) {
    iterations = max(iterations, 1);
    int64_t total = 0;
    for (int i = 0; i < iterations; ++i) {
        runguard_options opt;
        opt.command = {"true"};
        total += runit(opt).memory;
    }
    int64_t baseline = total / iterations;
    LOG(INFO) << "Memory baseline: " << baseline << " bytes over " << iterations << " runs";
    return baseline;
}

int64_t adjusted_memory(int64_t raw, int64_t baseline) {
    return max<int64_t>(0, raw - baseline);
}

}  // namespace judgebox
