#include "config.hpp"

namespace judgebox {
using namespace std;

filesystem::path COMMAND_PATH = "command";
filesystem::path WORK_DIR = ".";
int COMPILATION_TIME_LIMIT = 5;  // 5s
int VERSION_TIME_LIMIT = 10;     // 10s
int JUDGER_TIME_LIMIT = 10;       // 10s
int BASELINE_ITERATIONS = 3;
int64_t OUTPUT_LIMIT = 1 << 16;  // 64M
bool DEBUG = false;

}  // namespace judgebox
