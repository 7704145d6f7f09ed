#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include "common/exceptions.hpp"
#include "common/python.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "protocol/command.hpp"
#include "protocol/response.hpp"
using namespace std;

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    // stdout 只用于输出 CBOR 响应
    FLAGS_logtostderr = true;

    namespace po = boost::program_options;
    po::options_description desc("judgebox options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("command-path", po::value<string>(), "set the path of the command file, which is deleted after being read. You can either pass it from environ COMMANDPATH")
        ("work-dir", po::value<string>(), "set the directory to compile and run the program in, default to current directory. You can either pass it from environ WORKDIR")
        ("compile-time-limit", po::value<int>(), "set time limit in seconds for compilers, default to 5. You can either pass it from environ COMPILETIMELIMIT")
        ("version-time-limit", po::value<int>(), "set time limit in seconds for version queries, default to 10. You can either pass it from environ VERSIONTIMELIMIT")
        ("judger-time-limit", po::value<int>(), "set time limit in seconds for each call into the custom judger, default to 10. You can either pass it from environ JUDGERTIMELIMIT")
        ("baseline-iterations", po::value<int>(), "set how many times an empty command is run to measure the memory baseline, default to 3. You can either pass it from environ BASELINEITERATIONS")
        ("output-limit", po::value<int64_t>(), "set the maximum size in KB of stdout and stderr kept from the program, default to 65536(64MB). You can either pass it from environ OUTPUTLIMIT")
        ("debug", "turn on the debug mode to keep source files and compiled artifacts in the work directory.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "judgebox: Read one command, compile and test the program, write one CBOR response to stdout" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "judgebox 1.0" << endl;
        return EXIT_SUCCESS;
    }

    try {
        if (vm.count("debug")) {
            judgebox::DEBUG = true;
        } else if (getenv("DEBUG")) {
            judgebox::DEBUG = true;
        }

        if (vm.count("command-path")) {
            judgebox::COMMAND_PATH = filesystem::path(vm.at("command-path").as<string>());
        } else if (getenv("COMMANDPATH")) {
            judgebox::COMMAND_PATH = filesystem::path(getenv("COMMANDPATH"));
        }

        if (vm.count("work-dir")) {
            judgebox::WORK_DIR = filesystem::path(vm.at("work-dir").as<string>());
        } else if (getenv("WORKDIR")) {
            judgebox::WORK_DIR = filesystem::path(getenv("WORKDIR"));
        }

        if (vm.count("compile-time-limit")) {
            judgebox::COMPILATION_TIME_LIMIT = vm["compile-time-limit"].as<int>();
        } else if (getenv("COMPILETIMELIMIT")) {
            judgebox::COMPILATION_TIME_LIMIT = boost::lexical_cast<int>(getenv("COMPILETIMELIMIT"));
        }

        if (vm.count("version-time-limit")) {
            judgebox::VERSION_TIME_LIMIT = vm["version-time-limit"].as<int>();
        } else if (getenv("VERSIONTIMELIMIT")) {
            judgebox::VERSION_TIME_LIMIT = boost::lexical_cast<int>(getenv("VERSIONTIMELIMIT"));
        }

        if (vm.count("judger-time-limit")) {
            judgebox::JUDGER_TIME_LIMIT = vm["judger-time-limit"].as<int>();
        } else if (getenv("JUDGERTIMELIMIT")) {
            judgebox::JUDGER_TIME_LIMIT = boost::lexical_cast<int>(getenv("JUDGERTIMELIMIT"));
        }

        if (vm.count("baseline-iterations")) {
            judgebox::BASELINE_ITERATIONS = vm["baseline-iterations"].as<int>();
        } else if (getenv("BASELINEITERATIONS")) {
            judgebox::BASELINE_ITERATIONS = boost::lexical_cast<int>(getenv("BASELINEITERATIONS"));
        }

        if (vm.count("output-limit")) {
            judgebox::OUTPUT_LIMIT = vm["output-limit"].as<int64_t>();
        } else if (getenv("OUTPUTLIMIT")) {
            judgebox::OUTPUT_LIMIT = boost::lexical_cast<int64_t>(getenv("OUTPUTLIMIT"));
        }
    } catch (boost::bad_lexical_cast& e) {
        cerr << "Malformed environment variable: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    try {
        judgebox::init_python(argv[0]);
    } catch (judgebox::internal_error& e) {
        LOG(ERROR) << e.what();
        return EXIT_FAILURE;
    }

    judgebox::command cmd;
    try {
        cmd = judgebox::read_command(judgebox::COMMAND_PATH);
    } catch (judgebox::protocol_error& e) {
        LOG(ERROR) << "Unable to decode command: " << e.what();
        return EXIT_FAILURE;
    } catch (system_error& e) {
        LOG(ERROR) << "Unable to read command " << judgebox::COMMAND_PATH << ": " << e.what();
        return EXIT_FAILURE;
    }

    nlohmann::json response = judgebox::handle(cmd);

    try {
        judgebox::write_response(cout, response);
    } catch (system_error& e) {
        LOG(ERROR) << e.what();
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
