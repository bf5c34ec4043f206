#pragma once

#include <mutex>
#include <string>
#include <vector>
#include "testrunner/outcome.hpp"

namespace testrunner {

/**
 * @brief 被监控的子进程，由 supervisor 独占
 *
 * 子进程继承 testrunner 的标准输入输出，testrunner 不读取、不缓冲子进程的输出。
 * 子进程恰好被回收一次：wait() 正常回收，或者析构时杀死并回收。
 *
 * request_termination() 可以在其他线程调用，与 wait() 之间通过内部的锁同步：
 * wait() 先在不回收的情况下等待子进程结束，标记为已结束后才回收，
 * 因此永远不会向已经回收的 pid 发送信号。
 */
class child_process {
public:
    child_process();
    ~child_process();

    child_process(const child_process &) = delete;
    child_process &operator=(const child_process &) = delete;

    /**
     * @brief 启动子进程
     * @param command 子进程的 argv，原样传递，command[0] 按 PATH 查找
     * @throw spawn_error 可执行文件不存在或无法执行
     * @throw std::system_error 系统调用失败
     */
    void start(const std::vector<std::string> &command);

    /**
     * @brief 阻塞直到子进程结束并回收
     * @return 子进程结束的原始信息
     */
    termination_info wait();

    /**
     * @brief 请求终止子进程，每个子进程最多发出一次终止请求
     * @return 是否真的发出了终止请求；子进程已结束或已请求过时返回 false
     */
    bool request_termination();

    bool running() const;

    long id() const;

private:
    enum class state {
        idle,
        running,
        exited,
        reaped
    };

    mutable std::mutex mtx;
    state current = state::idle;
    bool termination_requested = false;

#ifdef _WIN32
    void *process_handle = nullptr;
    unsigned long pid = 0;
#else
    int pid = -1;
#endif

    void kill_and_reap() noexcept;
};

}  // namespace testrunner
