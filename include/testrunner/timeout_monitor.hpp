#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace testrunner {

/**
 * @brief 在后台线程中等待截止时间，与等待子进程结束同时进行
 *
 * timeout_monitor 不持有子进程，只在截止时间到达时调用 arm() 传入的回调，
 * 由回调向 supervisor 请求终止子进程。回调的返回值表示终止请求是否真的发出，
 * 因此子进程先结束时不会被判为超时。
 */
class timeout_monitor {
public:
    /**
     * @brief 截止时间到达时调用，返回是否真的发出了终止请求
     */
    typedef std::function<bool()> expire_handler;

    timeout_monitor();

    /**
     * @brief 析构时取消计时并等待后台线程退出
     */
    ~timeout_monitor();

    timeout_monitor(const timeout_monitor &) = delete;
    timeout_monitor &operator=(const timeout_monitor &) = delete;

    /**
     * @brief 开始计时，只能调用一次
     * @param timeout 从现在开始的超时时间
     * @param on_expire 截止时间到达且未被取消时调用，只调用一次
     */
    void arm(std::chrono::duration<double> timeout, expire_handler on_expire);

    /**
     * @brief 取消计时并等待后台线程退出
     * 如果回调正在执行，等待回调返回。可以重复调用。
     * @return 是否已经超时（回调发出了终止请求）
     */
    bool cancel();

    /**
     * @brief 回调是否发出了终止请求
     */
    bool expired() const;

private:
    mutable std::mutex mtx;
    std::condition_variable cv;
    std::thread worker;
    bool armed = false;
    bool cancelled = false;
    bool fired = false;

    void run(std::chrono::steady_clock::time_point deadline, expire_handler on_expire);
};

/**
 * @brief 子进程在超时前结束，但运行时间已经接近超时时间
 * 运行时间 >= (1 - TIMEOUT_WARNING_MARGIN) * timeout 时为真（包含边界）
 */
bool dangerously_close(double elapsed, double timeout);

/**
 * @brief 接近超时时输出的两行警告
 */
std::vector<std::string> timeout_warning_lines(double elapsed, double timeout);

}  // namespace testrunner
