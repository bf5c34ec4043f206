#include "testrunner/supervisor.hpp"
#include <glog/logging.h>
#include <system_error>
#include "testrunner/arguments.hpp"
#include "testrunner/child_process.hpp"
#include "testrunner/common/exceptions.hpp"
#include "testrunner/common/utils.hpp"
#include "testrunner/config.hpp"
#include "testrunner/lifecycle_log.hpp"
#include "testrunner/timeout_monitor.hpp"
#include "testrunner/workdir.hpp"

namespace testrunner {
using namespace std;

const char *state_name(supervisor_state state) {
    switch (state) {
        case supervisor_state::idle: return "idle";
        case supervisor_state::parsed: return "parsed";
        case supervisor_state::chdir_applied: return "chdir-applied";
        case supervisor_state::launched: return "launched";
        case supervisor_state::racing: return "racing";
        case supervisor_state::terminated: return "terminated";
        case supervisor_state::reported: return "reported";
    }
    return "unknown";
}

supervisor::supervisor(const invocation &inv, ostream &err)
    : inv(inv), err(err), display_label(effective_label(inv.label, inv.command)) {}

void supervisor::transition(supervisor_state next) {
    LOG(INFO) << "supervisor " << state_name(current) << " -> " << state_name(next);
    current = next;
}

void supervisor::write_lines(const vector<string> &lines) {
    for (auto &line : lines) err << line << endl;
}

int supervisor::run() {
    if (current != supervisor_state::idle) throw internal_error("supervisor already ran");
    transition(supervisor_state::parsed);

    if (!inv.chdir.empty()) {
        change_working_directory(inv.chdir);
        transition(supervisor_state::chdir_applied);
    }

    lifecycle_logger logger(err, inv.verbose, display_label);
    logger.begin(inv.command);

    // The monitor is declared after the child, so it is stopped before the
    // child is destroyed on every path.
    child_process child;
    elapsed_time clock;
    child.start(inv.command);
    transition(supervisor_state::launched);

    timeout_monitor monitor;
    if (inv.use_timeout) {
        monitor.arm(chrono::duration<double>(inv.timeout.seconds),
                    [&child] { return child.request_termination(); });
    }
    transition(supervisor_state::racing);

    termination_info info = child.wait();
    bool timed_out = monitor.cancel();
    elapsed_seconds = clock.seconds();
    transition(supervisor_state::terminated);

    if (timed_out) {
        final_outcome = classify_timeout(info, inv.timeout.seconds);
    } else {
        final_outcome = classify(info);
        if (inv.use_timeout && dangerously_close(elapsed_seconds, inv.timeout.seconds))
            write_lines(timeout_warning_lines(elapsed_seconds, inv.timeout.seconds));
    }

    write_lines(report_lines(final_outcome));
    logger.end(elapsed_seconds, final_outcome);
    transition(supervisor_state::reported);

    return exit_code_for(final_outcome);
}

supervisor_state supervisor::state() const {
    return current;
}

const outcome &supervisor::result() const {
    return final_outcome;
}

double supervisor::elapsed() const {
    return elapsed_seconds;
}

const string &supervisor::label() const {
    return display_label;
}

int execute(const vector<string> &args, ostream &out, ostream &err) {
    try {
        invocation inv = parse_arguments(args);
        if (inv.help) {
            print_usage(out);
            return E_USAGE;
        }

        supervisor sup(inv, err);
        return sup.run();
    } catch (argument_error &e) {
        err << LOG_PREFIX << ": " << e.diagnostic() << endl;
        print_usage_line(err);
        return e.exit_code();
    } catch (testrunner_exception &e) {
        if (e.exit_code() == E_INTERNAL_ERROR) LOG(ERROR) << e;
        err << LOG_PREFIX << ": " << e.diagnostic() << endl;
        return e.exit_code();
    } catch (system_error &e) {
        LOG(ERROR) << "system error " << e.code() << ": " << e.what();
        err << LOG_PREFIX << ": internal error: " << e.what() << endl;
        return E_INTERNAL_ERROR;
    } catch (exception &e) {
        LOG(ERROR) << e.what();
        err << LOG_PREFIX << ": internal error: " << e.what() << endl;
        return E_INTERNAL_ERROR;
    }
}

}  // namespace testrunner
