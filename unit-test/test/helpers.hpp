#pragma once

#include <errno.h>
#include <signal.h>
#include <unistd.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#ifndef ARGV_DUMP_PATH
#error "ARGV_DUMP_PATH must point to the argv_dump helper"
#endif

/**
 * Fresh directory under the system temp dir, removed with everything in it
 * when the test ends.
 */
struct temp_dir {
    std::filesystem::path path;

    temp_dir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "testrunner-XXXXXX").string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        if (!mkdtemp(buf.data())) throw std::runtime_error("mkdtemp failed");
        path = std::filesystem::canonical(buf.data());
    }

    ~temp_dir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    temp_dir(const temp_dir &) = delete;
    temp_dir &operator=(const temp_dir &) = delete;
};

/**
 * Restores the working directory of the test process on scope exit.
 */
struct cwd_guard {
    std::filesystem::path saved = std::filesystem::current_path();

    ~cwd_guard() {
        std::error_code ec;
        std::filesystem::current_path(saved, ec);
    }
};

inline std::string read_file(const std::filesystem::path &path) {
    std::ifstream fin(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(fin)), std::istreambuf_iterator<char>());
}

/**
 * Splits the NUL-terminated records written by argv_dump.
 */
inline std::vector<std::string> read_dumped_args(const std::filesystem::path &path) {
    std::string content = read_file(path);
    std::vector<std::string> args;
    std::string current;
    for (char c : content) {
        if (c == '\0') {
            args.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    return args;
}

/**
 * A process is gone once it no longer exists or is a zombie. Orphaned
 * grandchildren are reaped by whoever adopts them, which may take a while.
 */
inline bool process_alive(long pid) {
    if (kill(static_cast<pid_t>(pid), 0) != 0 && errno == ESRCH) return false;
    std::string stat = read_file("/proc/" + std::to_string(pid) + "/stat");
    auto pos = stat.rfind(')');
    if (pos == std::string::npos || pos + 2 >= stat.size()) return false;
    return stat[pos + 2] != 'Z';
}

inline bool wait_until_gone(long pid, std::chrono::milliseconds limit = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (process_alive(pid)) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

/**
 * Pid written to a file by a background shell job, once it is there.
 */
inline long wait_for_pid_file(const std::filesystem::path &path, std::chrono::milliseconds limit = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    for (;;) {
        std::string content = read_file(path);
        if (!content.empty() && content.back() == '\n') return std::stol(content);
        if (std::chrono::steady_clock::now() >= deadline) return -1;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

inline std::string argv_dump_path() {
    return ARGV_DUMP_PATH;
}
