#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace judgebox {
using namespace std;

judgebox_exception::judgebox_exception()
    : judgebox_exception("") {}

judgebox_exception::judgebox_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judgebox_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const judgebox_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : judgebox_exception() {}

internal_error::internal_error(const string &message)
    : judgebox_exception(message) {}

invalid_program::invalid_program()
    : judgebox_exception() {}

invalid_program::invalid_program(const string &message)
    : judgebox_exception(message) {}

judger_error::judger_error()
    : judgebox_exception() {}

judger_error::judger_error(const string &message)
    : judgebox_exception(message) {}

protocol_error::protocol_error()
    : judgebox_exception() {}

protocol_error::protocol_error(const string &message)
    : judgebox_exception(message) {}

}  // namespace judgebox
