#include "testrunner/lifecycle_log.hpp"
#include <fmt/chrono.h>
#include <fmt/core.h>
#include <boost/algorithm/string/replace.hpp>
#include <ctime>
#include <filesystem>
#include "testrunner/common/utils.hpp"
#include "testrunner/config.hpp"

namespace testrunner {
using namespace std;

string default_label(const vector<string> &command) {
    if (command.empty()) return "";
    string name = filesystem::path(command[0]).filename().string();
    return name.empty() ? command[0] : name;
}

string sanitize_label(const string &label) {
    return boost::algorithm::replace_all_copy(label, ":", "__");
}

string effective_label(const string &label, const vector<string> &command) {
    return sanitize_label(label.empty() ? default_label(command) : label);
}

string begin_line(const string &label, chrono::system_clock::time_point when, const vector<string> &command) {
    time_t t = chrono::system_clock::to_time_t(when);
    return fmt::format("{}: begin {} @{:%Y-%m-%dT%H:%M:%S}: [{}] {}",
                       LOG_PREFIX, label, fmt::localtime(t), CHILD_KIND, join_command(command));
}

string end_line(const string &label, double elapsed, const outcome &result) {
    return fmt::format("{}: end {}: {:.3f}s{}", LOG_PREFIX, label, elapsed, outcome_suffix(result));
}

lifecycle_logger::lifecycle_logger(ostream &os, bool enabled, string label)
    : os(os), enabled(enabled), display_label(move(label)) {}

void lifecycle_logger::begin(const vector<string> &command) {
    if (!enabled) return;
    os << begin_line(display_label, chrono::system_clock::now(), command) << endl;
}

void lifecycle_logger::end(double elapsed, const outcome &result) {
    if (!enabled) return;
    os << end_line(display_label, elapsed, result) << endl;
}

const string &lifecycle_logger::label() const {
    return display_label;
}

}  // namespace testrunner
