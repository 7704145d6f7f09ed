#include "dispatcher.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"
#include "judge/harness.hpp"
#include "judge/judger.hpp"
#include "protocol/response.hpp"
#include "toolchain/toolchain.hpp"

namespace judgebox {
using namespace std;
using namespace nlohmann;

json do_test(const test_command &cmd) {
    return run_tests(cmd);
}

json do_versions(const versions_command &) {
    json versions = json::array();
    for (language lang : all_languages()) {
        const toolchain &tc = get_toolchain(lang);
        try {
            versions.push_back(tc.version());
        } catch (internal_error &e) {
            LOG(ERROR) << "Unable to query version of " << tc.name() << ": " << e.what();
            return err_response(e.what());
        } catch (system_error &e) {
            LOG(ERROR) << "Unable to query version of " << tc.name() << ": " << e.what();
            return err_response(e.what());
        }
    }
    return versions;
}

json do_validate_judger(const validate_judger_command &cmd) {
    if (auto error = validate_judger(cmd.judger))
        return err_response(*error);
    return ok_response(nullptr);
}

json handle(const command &cmd) {
    return visit(overloaded{
                     [](const test_command &c) { return do_test(c); },
                     [](const versions_command &c) { return do_versions(c); },
                     [](const validate_judger_command &c) { return do_validate_judger(c); }},
                 cmd);
}

}  // namespace judgebox
