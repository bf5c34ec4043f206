#include "testrunner/timeout_monitor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "testrunner/common/exceptions.hpp"
#include "testrunner/config.hpp"

namespace testrunner {
using namespace std;

timeout_monitor::timeout_monitor() {}

timeout_monitor::~timeout_monitor() {
    cancel();
}

void timeout_monitor::arm(chrono::duration<double> timeout, expire_handler on_expire) {
    lock_guard<mutex> lock(mtx);
    if (armed) throw internal_error("timeout monitor armed twice");
    armed = true;

    auto now = chrono::steady_clock::now();
    auto deadline = chrono::steady_clock::time_point::max();
    // Deadlines past the end of the clock never expire.
    if (timeout < chrono::duration<double>(deadline - now))
        deadline = now + chrono::duration_cast<chrono::steady_clock::duration>(timeout);
    LOG(INFO) << fmt::format("setting wall-time limit to {:.3f} seconds", timeout.count());
    worker = thread(&timeout_monitor::run, this, deadline, move(on_expire));
}

void timeout_monitor::run(chrono::steady_clock::time_point deadline, expire_handler on_expire) {
    unique_lock<mutex> lock(mtx);
    if (deadline == chrono::steady_clock::time_point::max()) {
        cv.wait(lock, [this] { return cancelled; });
        return;
    }
    if (cv.wait_until(lock, deadline, [this] { return cancelled; }))
        return;

    LOG(WARNING) << "timelimit exceeded (wall time): aborting command";
    // The handler takes the child's lock; never call it with ours held.
    lock.unlock();
    bool issued = on_expire();
    lock.lock();
    fired = issued;
}

bool timeout_monitor::cancel() {
    {
        lock_guard<mutex> lock(mtx);
        cancelled = true;
    }
    cv.notify_all();
    if (worker.joinable()) worker.join();

    lock_guard<mutex> lock(mtx);
    return fired;
}

bool timeout_monitor::expired() const {
    lock_guard<mutex> lock(mtx);
    return fired;
}

bool dangerously_close(double elapsed, double timeout) {
    return elapsed >= timeout * (1 - TIMEOUT_WARNING_MARGIN);
}

vector<string> timeout_warning_lines(double elapsed, double timeout) {
    return {
        fmt::format("Warning: Test duration ({:.3f} seconds) is dangerously close to maximum timeout ({} seconds)", elapsed, timeout),
        "Warning: Either make the test faster or increase the timeout"};
}

}  // namespace testrunner
