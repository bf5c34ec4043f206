#include "testrunner/common/exceptions.hpp"
#include <string.h>
#include <errno.h>
#include <boost/exception/diagnostic_information.hpp>
#include "testrunner/config.hpp"

namespace testrunner {
using namespace std;

testrunner_exception::testrunner_exception()
    : testrunner_exception("") {}

testrunner_exception::testrunner_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *testrunner_exception::what() const noexcept {
    return message.c_str();
}

int testrunner_exception::exit_code() const noexcept {
    return E_INTERNAL_ERROR;
}

string testrunner_exception::diagnostic() const {
    return "internal error: " + message;
}

std::ostream &operator<<(std::ostream &os, const testrunner_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

argument_error::argument_error()
    : testrunner_exception() {}

argument_error::argument_error(const string &message)
    : testrunner_exception(message) {}

int argument_error::exit_code() const noexcept {
    return E_USAGE;
}

string argument_error::diagnostic() const {
    return what();
}

configuration_error::configuration_error()
    : testrunner_exception() {}

configuration_error::configuration_error(const string &message)
    : testrunner_exception(message) {}

int configuration_error::exit_code() const noexcept {
    return E_CONFIGURATION;
}

string configuration_error::diagnostic() const {
    return what();
}

spawn_error::spawn_error(const string &command, int err)
    : testrunner_exception(strerror(err)), cmd(command), err(err) {}

spawn_error::spawn_error(const string &command, int err, const string &message)
    : testrunner_exception(message), cmd(command), err(err) {}

const string &spawn_error::command() const noexcept {
    return cmd;
}

int spawn_error::error_code() const noexcept {
    return err;
}

int spawn_error::exit_code() const noexcept {
    return err == ENOENT ? E_COMMAND_NOT_FOUND : E_CANNOT_EXECUTE;
}

string spawn_error::diagnostic() const {
    return cmd + ": " + what();
}

internal_error::internal_error()
    : testrunner_exception() {}

internal_error::internal_error(const string &message)
    : testrunner_exception(message) {}

}  // namespace testrunner
