#include "common/exceptions.hpp"
#include <boost/core/demangle.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <typeinfo>

namespace vibe {
using namespace std;

eval_exception::eval_exception()
    : eval_exception("") {}

eval_exception::eval_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *eval_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const eval_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : eval_exception() {}

internal_error::internal_error(const string &message)
    : eval_exception(message) {}

network_error::network_error()
    : eval_exception() {}

network_error::network_error(const string &message)
    : eval_exception(message) {}

browser_error::browser_error()
    : eval_exception() {}

browser_error::browser_error(const string &message)
    : eval_exception(message) {}

syntax_error::syntax_error(const string &message, int line)
    : eval_exception(message), line(line) {}

assertion_failure::assertion_failure()
    : eval_exception() {}

assertion_failure::assertion_failure(const string &message)
    : eval_exception(message) {}

string exception_type_name(const exception &e) {
    string name = boost::core::demangle(typeid(e).name());
    size_t pos = name.rfind("::");
    return pos == string::npos ? name : name.substr(pos + 2);
}

}  // namespace vibe
