#include "testrunner/child_process.hpp"
#include <errno.h>
#include <glog/logging.h>
#include <windows.h>
#include "testrunner/common/exceptions.hpp"

namespace testrunner {
using namespace std;

/*
 * Quote one argument so that the MSVC runtime's command line splitting
 * (CommandLineToArgvW rules) hands it to the child unchanged.
 */
static string quote_argument(const string &arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == string::npos) return arg;

    string result = "\"";
    for (auto it = arg.begin();; ++it) {
        size_t backslashes = 0;
        while (it != arg.end() && *it == '\\') {
            ++it;
            ++backslashes;
        }

        if (it == arg.end()) {
            // Escape the trailing backslashes so the closing quote stays a quote.
            result.append(backslashes * 2, '\\');
            break;
        } else if (*it == '"') {
            result.append(backslashes * 2 + 1, '\\');
            result.push_back(*it);
        } else {
            result.append(backslashes, '\\');
            result.push_back(*it);
        }
    }
    result.push_back('"');
    return result;
}

static string last_error_message(DWORD err) {
    LPSTR buffer = nullptr;
    DWORD size = FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                                nullptr, err, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT), (LPSTR)&buffer, 0, nullptr);
    if (size == 0 || !buffer) return "error " + to_string(err);
    string message(buffer, size);
    LocalFree(buffer);
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r' || message.back() == '.'))
        message.pop_back();
    return message;
}

child_process::child_process() {}

child_process::~child_process() {
    kill_and_reap();
}

void child_process::start(const vector<string> &command) {
    {
        lock_guard<mutex> lock(mtx);
        if (current != state::idle) throw internal_error("child process already started");
    }
    if (command.empty()) throw internal_error("empty command");

    string command_line;
    for (size_t i = 0; i < command.size(); ++i) {
        if (i) command_line += ' ';
        command_line += quote_argument(command[i]);
    }

    STARTUPINFOA startup_info;
    ZeroMemory(&startup_info, sizeof(startup_info));
    startup_info.cb = sizeof(startup_info);

    PROCESS_INFORMATION process_info;
    ZeroMemory(&process_info, sizeof(process_info));

    if (!CreateProcessA(nullptr, command_line.data(), nullptr, nullptr, TRUE, 0,
                        nullptr, nullptr, &startup_info, &process_info)) {
        DWORD err = GetLastError();
        int code = err == ERROR_FILE_NOT_FOUND || err == ERROR_PATH_NOT_FOUND ? ENOENT : EACCES;
        LOG(ERROR) << "CreateProcess failed for " << command[0] << ": " << err;
        throw spawn_error(command[0], code, last_error_message(err));
    }
    CloseHandle(process_info.hThread);

    lock_guard<mutex> lock(mtx);
    process_handle = process_info.hProcess;
    pid = process_info.dwProcessId;
    current = state::running;
    LOG(INFO) << "started command " << command[0] << " with pid " << pid;
}

termination_info child_process::wait() {
    HANDLE handle;
    {
        lock_guard<mutex> lock(mtx);
        if (current != state::running) throw internal_error("child process is not running");
        handle = process_handle;
    }

    if (WaitForSingleObject(handle, INFINITE) != WAIT_OBJECT_0)
        throw internal_error("waiting on child failed: " + last_error_message(GetLastError()));

    lock_guard<mutex> lock(mtx);
    current = state::exited;

    DWORD exit_code = 0;
    if (!GetExitCodeProcess(handle, &exit_code)) {
        DWORD err = GetLastError();
        CloseHandle(handle);
        process_handle = nullptr;
        current = state::reaped;
        throw internal_error("unable to get exit code of child: " + last_error_message(err));
    }
    CloseHandle(handle);
    process_handle = nullptr;
    current = state::reaped;

    // Windows has no signals: a crash shows up as an NTSTATUS exit code.
    return termination_info::exited(exit_code);
}

bool child_process::request_termination() {
    lock_guard<mutex> lock(mtx);
    if (current != state::running || termination_requested) return false;
    termination_requested = true;

    LOG(WARNING) << "terminating process " << pid;
    if (!TerminateProcess(process_handle, 1)) {
        LOG(ERROR) << "unable to terminate process " << pid << ": " << last_error_message(GetLastError());
        return false;
    }
    return true;
}

bool child_process::running() const {
    lock_guard<mutex> lock(mtx);
    return current == state::running;
}

long child_process::id() const {
    lock_guard<mutex> lock(mtx);
    return static_cast<long>(pid);
}

void child_process::kill_and_reap() noexcept {
    lock_guard<mutex> lock(mtx);
    if (!process_handle) return;

    if (current == state::running) {
        LOG(WARNING) << "process " << pid << " still running, terminating";
        if (!TerminateProcess(process_handle, 1))
            LOG(ERROR) << "unable to terminate process " << pid;
        WaitForSingleObject(process_handle, INFINITE);
    }
    CloseHandle(process_handle);
    process_handle = nullptr;
    current = state::reaped;
}

}  // namespace testrunner
