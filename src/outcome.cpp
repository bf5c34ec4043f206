#include "testrunner/outcome.hpp"
#include <fmt/core.h>
#ifndef _WIN32
#include <sys/wait.h>
#endif
#include "testrunner/common/exceptions.hpp"
#include "testrunner/config.hpp"
#include "testrunner/fault_table.hpp"

namespace testrunner {
using namespace std;

termination_info termination_info::exited(uint32_t exit_code) {
    termination_info info;
    info.exit_code = exit_code;
    return info;
}

termination_info termination_info::killed(int signal, bool core_dumped) {
    termination_info info;
    info.signaled = true;
    info.signal = signal;
    info.core_dumped = core_dumped;
    return info;
}

#ifndef _WIN32
termination_info termination_info::from_wait_status(int status) {
    if (WIFEXITED(status)) {
        return exited(WEXITSTATUS(status));
    } else if (WIFSIGNALED(status)) {
#ifdef WCOREDUMP
        return killed(WTERMSIG(status), WCOREDUMP(status));
#else
        return killed(WTERMSIG(status), false);
#endif
    } else {
        throw internal_error(fmt::format("unknown status: {:x}", status));
    }
}
#endif

outcome classify(const termination_info &info) {
    outcome result;
    if (info.signaled) {
        result.type = outcome::kind::signaled;
        result.signal = info.signal;
        result.core_dumped = info.core_dumped;
        return result;
    }

    result.exit_code = info.exit_code;
    if (const char *name = fault_name(info.exit_code)) {
        result.type = outcome::kind::platform_fault;
        result.fault_name = name;
    } else {
        result.type = outcome::kind::normal_exit;
    }
    return result;
}

outcome classify_timeout(const termination_info &info, double timeout) {
    outcome result;
    result.type = outcome::kind::timed_out;
    result.timeout = timeout;
    result.exit_code = info.exit_code;
    if (info.signaled) {
        result.signal = info.signal;
        result.core_dumped = info.core_dumped;
    }
    return result;
}

static string signal_message(int signal, bool core_dumped) {
    return fmt::format("Process exited due to signal {}{}", signal, core_dumped ? "; dumped core" : "");
}

string describe(const outcome &result) {
    switch (result.type) {
        case outcome::kind::normal_exit:
            return "";
        case outcome::kind::signaled:
            return signal_message(result.signal, result.core_dumped);
        case outcome::kind::platform_fault:
            return fmt::format("Process exited with exit code 0x{:08X} ({})", result.exit_code, result.fault_name);
        case outcome::kind::timed_out:
            return result.signal ? signal_message(result.signal, result.core_dumped) : "";
    }
    return "";
}

vector<string> report_lines(const outcome &result) {
    vector<string> lines;
    if (result.type == outcome::kind::timed_out)
        lines.push_back(fmt::format("Timed out after {} seconds", result.timeout));
    string message = describe(result);
    if (!message.empty()) lines.push_back(message);
    return lines;
}

string outcome_suffix(const outcome &result) {
    switch (result.type) {
        case outcome::kind::normal_exit:
            return fmt::format(", exit code {}", result.exit_code);
        case outcome::kind::signaled:
            return fmt::format(", signal {}", result.signal);
        case outcome::kind::platform_fault:
            return fmt::format(", exit code 0x{:08X} ({})", result.exit_code, result.fault_name);
        case outcome::kind::timed_out:
            if (result.signal) return fmt::format(", timed out, signal {}", result.signal);
            return ", timed out";
    }
    return "";
}

int exit_code_for(const outcome &result) {
    switch (result.type) {
        case outcome::kind::normal_exit:
        case outcome::kind::platform_fault:
            return static_cast<int>(result.exit_code);
        case outcome::kind::signaled:
            return E_SIGNAL_BASE + result.signal;
        case outcome::kind::timed_out:
            return E_TIMEOUT;
    }
    return E_INTERNAL_ERROR;
}

}  // namespace testrunner
