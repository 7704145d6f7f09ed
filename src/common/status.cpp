#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace judgebox {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> wire_string = boost::assign::map_list_of
    (status::TIME_LIMIT_EXCEEDED, "TimeLimitExceeded")
    (status::MEMORY_LIMIT_EXCEEDED, "MemoryLimitExceeded")
    (status::RUNTIME_ERROR, "RuntimeError")
    (status::CORRECT, "Correct")
    (status::WRONG, "Wrong");

static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::CORRECT, "Correct")
    (status::WRONG, "Wrong Answer");
// clang-format on

const char *get_wire_name(status stat) {
    return wire_string.at(stat);
}

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

}  // namespace judgebox
