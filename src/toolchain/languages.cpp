#include "toolchain/languages.hpp"
#include <boost/algorithm/string/join.hpp>
#include <fmt/core.h>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"
#include "common/utils.hpp"

namespace judgebox {
using namespace std;

const char *JAVA_HINT = "\nNote that the program's class should be named Main.\n";

static const vector<string> CC_FLAGS = {"-O2", "-march=native", "-pipe", "-w", "-fmax-errors=3"};
static const vector<string> CC_FLAGS_AFTER = {"-lm"};
static const vector<string> RUSTC_ARGS = {"--crate-name=program", "--crate-type=bin", "--edition=2021", "-Copt-level=3", "-Ctarget-cpu=native"};

static string python() { return get_env("PYTHON", "python3"); }
static string java() { return get_env("JAVA", "java"); }
static string javac() { return get_env("JAVAC", "javac"); }
static string jar() { return get_env("JAR", "jar"); }
static string rustc() { return get_env("RUSTC", "rustc"); }

string python3_toolchain::name() const {
    return "Python 3";
}

filesystem::path python3_toolchain::compile(work_dir &dir, const string &code) const {
    filesystem::path source = dir.write("source.py", code);
    dir.artifact("__pycache__");
    compile_run(dir, make_command(python(), "-m", "py_compile", "source.py"));
    return source;
}

vector<string> python3_toolchain::run(const filesystem::path &artifact) const {
    return make_command(python(), artifact);
}

string python3_toolchain::version() const {
    return query_version(make_command(python(), "--version"));
}

gcc_toolchain::gcc_toolchain(const string &compiler_env, const string &default_compiler, const string &source_name, const string &std_flag)
    : compiler_env(compiler_env), default_compiler(default_compiler), source_name(source_name), std_flag(std_flag) {}

string gcc_toolchain::name() const {
    return compiler_env == "CC" ? "C" : "C++";
}

string gcc_toolchain::compiler() const {
    return get_env(compiler_env, default_compiler);
}

vector<string> gcc_toolchain::flags() const {
    vector<string> result = CC_FLAGS;
    append(result, CC_FLAGS_AFTER);
    result.push_back(std_flag);
    return result;
}

filesystem::path gcc_toolchain::compile(work_dir &dir, const string &code) const {
    dir.write(source_name, code);
    filesystem::path out = dir.artifact("source");
    compile_run(dir, make_command(compiler(), CC_FLAGS, std_flag, source_name, CC_FLAGS_AFTER, "-o", "./source"));
    return out;
}

vector<string> gcc_toolchain::run(const filesystem::path &artifact) const {
    return make_command(artifact);
}

string gcc_toolchain::version() const {
    return query_version(make_command(compiler(), "--version")) +
           fmt::format("Cmdline: {} {}\n", compiler(), boost::algorithm::join(flags(), " "));
}

string java_toolchain::name() const {
    return "Java";
}

filesystem::path java_toolchain::compile(work_dir &dir, const string &code) const {
    dir.write("Main.java", code);
    dir.artifact("classes");
    filesystem::path out = dir.artifact("jar.jar");
    compile_run(dir, make_command(javac(), "-d", "classes", "-encoding", "UTF8", "Main.java"), JAVA_HINT);
    compile_run(dir, make_command(jar(), "cfe", "jar.jar", "Main", "-C", "classes", "."), JAVA_HINT);
    return out;
}

vector<string> java_toolchain::run(const filesystem::path &artifact) const {
    return make_command(java(), "-jar", artifact);
}

string java_toolchain::version() const {
    return query_version(make_command(java(), "--version")) + "\n" +
           query_version(make_command(javac(), "--version")) + JAVA_HINT;
}

string rust_toolchain::name() const {
    return "Rust";
}

filesystem::path rust_toolchain::compile(work_dir &dir, const string &code) const {
    dir.write("source.rs", code);
    filesystem::path out = dir.artifact("source");
    compile_run(dir, make_command(rustc(), RUSTC_ARGS, "source.rs", "-o", "./source"));
    return out;
}

vector<string> rust_toolchain::run(const filesystem::path &artifact) const {
    return make_command(artifact);
}

string rust_toolchain::version() const {
    return query_version(make_command(rustc(), "--version")) + "\n" +
           fmt::format("Cmdline: {} {}", rustc(), boost::algorithm::join(RUSTC_ARGS, " "));
}

const toolchain &get_toolchain(language lang) {
    static const python3_toolchain python3;
    static const gcc_toolchain c("CC", "gcc", "source.c", "-std=gnu2x");
    static const gcc_toolchain cpp("CXX", "g++", "source.cpp", "-std=gnu++23");
    static const java_toolchain java;
    static const rust_toolchain rust;

    switch (lang) {
        case language::PYTHON3: return python3;
        case language::C: return c;
        case language::CPP: return cpp;
        case language::JAVA: return java;
        case language::RUST: return rust;
    }
    throw protocol_error(fmt::format("Unknown language {}", (int)lang));
}

}  // namespace judgebox
