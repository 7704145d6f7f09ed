#include "judge/harness.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include <cmath>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "protocol/response.hpp"
#include "toolchain/toolchain.hpp"
#include "toolchain/work_dir.hpp"

namespace judgebox {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const pass_record &record) {
    j = {{"kind", get_wire_name(record.kind)},
         {"time", record.time},
         {"memory_usage", record.memory_usage}};
}

optional<status> classify(const runguard_result &result, int64_t memory_usage, const optional<int64_t> &memory_limit) {
    if (result.timed_out)
        return status::TIME_LIMIT_EXCEEDED;
    if (memory_limit && memory_usage > *memory_limit * 1024 * 1024)
        return status::MEMORY_LIMIT_EXCEEDED;
    if (result.exitcode != 0 || result.signal != -1)
        return status::RUNTIME_ERROR;
    return nullopt;
}

pass_record run_test_case(size_t index, const test_case &tc, const vector<string> &command, const test_command &cmd, judger &checker, int64_t baseline) {
    string input = normalize_input(tc.input);
    runguard_result result = run_program(command, WORK_DIR, input, cmd.time_limit);

    pass_record record;
    record.time = (int64_t)floor(result.wall_time * 1000);
    record.memory_usage = adjusted_memory(result.memory, baseline);

    if (auto verdict = classify(result, record.memory_usage, cmd.memory_limit)) {
        record.kind = *verdict;
    } else {
        string actual_output = boost::algorithm::trim_copy(result.stdout_data);
        record.kind = checker.judge(index, input, tc.expected_output, actual_output) ? status::CORRECT : status::WRONG;
    }

    DLOG(INFO) << fmt::format("Test case {}: {}, {}ms, {} bytes, exitcode {}",
                              index, get_display_message(record.kind), record.time, record.memory_usage, result.exitcode);
    return record;
}

json run_tests(const test_command &cmd) {
    try {
        vector<test_case> tests = parse_tests(cmd.tests);
        const toolchain &tc = get_toolchain(cmd.lang);
        LOG(INFO) << fmt::format("Testing {} program on {} test cases, time limit {}ms", tc.name(), tests.size(), cmd.time_limit);

        unique_ptr<judger> checker = make_judger(cmd.custom_judger);

        work_dir dir(WORK_DIR);
        filesystem::path artifact = tc.compile(dir, cmd.code);
        vector<string> command = tc.run(artifact);

        int64_t baseline = calibrate_baseline(BASELINE_ITERATIONS);

        json passes = json::array();
        for (size_t i = 0; i < tests.size(); ++i)
            passes.push_back(json(run_test_case(i, tests[i], command, cmd, *checker, baseline)));
        return ok_response(passes);
    } catch (invalid_program &e) {
        LOG(INFO) << "Invalid program: " << e.what();
        return invalid_program_response(e.what());
    } catch (judger_error &e) {
        LOG(INFO) << "Judger failed: " << e.what();
        return invalid_program_response(e.what());
    } catch (internal_error &e) {
        LOG(ERROR) << e;
        return invalid_program_response(e.what());
    } catch (system_error &e) {
        LOG(ERROR) << "Unable to run program: " << e.what();
        return invalid_program_response(fmt::format("Unable to run program: {}", e.what()));
    }
}

}  // namespace judgebox
