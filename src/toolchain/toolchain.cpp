#include "toolchain/toolchain.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "runguard.hpp"

namespace judgebox {
using namespace std;

language language_from_ordinal(int64_t ordinal) {
    if (ordinal < (int64_t)language::PYTHON3 || ordinal > (int64_t)language::RUST)
        throw protocol_error(fmt::format("Unknown language {}", ordinal));
    return static_cast<language>(ordinal);
}

const vector<language> &all_languages() {
    static const vector<language> languages = {
        language::PYTHON3,
        language::C,
        language::CPP,
        language::JAVA,
        language::RUST};
    return languages;
}

void compile_run(const work_dir &dir, const vector<string> &command, const string &hint) {
    string cmdline = format_command(command);
    LOG(INFO) << "Compiling: " << cmdline;

    runguard_result result;
    try {
        result = run_tool(command, dir.root(), COMPILATION_TIME_LIMIT);
    } catch (system_error &e) {
        throw invalid_program(fmt::format("While running {}:\n\n{}\n{}", cmdline, e.what(), hint));
    }

    if (result.timed_out) {
        throw invalid_program(fmt::format("While running {}:\n\n{}Compilation timed out after {} seconds\n{}",
                                          cmdline, result.stdout_data, COMPILATION_TIME_LIMIT, hint));
    } else if (result.exitcode != 0) {
        LOG(INFO) << "Compilation failed with exitcode " << result.exitcode;
        throw invalid_program(fmt::format("While running {}:\n\n{}{}", cmdline, result.stdout_data, hint));
    }
}

string query_version(const vector<string> &command) {
    runguard_result result = run_tool(command, {}, VERSION_TIME_LIMIT, /* merge_stderr */ false);
    if (result.timed_out)
        throw internal_error(fmt::format("{} timed out after {} seconds", format_command(command), VERSION_TIME_LIMIT));
    if (result.exitcode != 0)
        throw internal_error(fmt::format("{} exited with {}: {}", format_command(command), result.exitcode, result.stderr_data));
    return result.stdout_data;
}

}  // namespace judgebox
