#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace testrunner {

/**
 * @brief 子进程结束时操作系统给出的原始信息，只生成一次，不再修改
 *
 * POSIX 下来自 waitpid 的 status；Windows 下只有退出码。
 */
struct termination_info {
    bool signaled = false;

    /**
     * @brief 原始退出码
     * POSIX 下为 0~255，Windows 下可能是 0xC0000005 这样的 NTSTATUS
     */
    uint32_t exit_code = 0;

    int signal = 0;
    bool core_dumped = false;

    static termination_info exited(uint32_t exit_code);
    static termination_info killed(int signal, bool core_dumped);

#ifndef _WIN32
    /**
     * @brief 从 waitpid 得到的 status 构造
     * @throw internal_error status 既不是正常退出也不是被信号终止
     */
    static termination_info from_wait_status(int status);
#endif
};

/**
 * @brief 与平台无关的子进程结束方式
 * 日志和退出码只依赖于 outcome，不再判断平台
 */
struct outcome {
    enum class kind {
        normal_exit,
        signaled,
        platform_fault,
        timed_out
    };

    kind type = kind::normal_exit;
    uint32_t exit_code = 0;

    /**
     * @brief 终止子进程的信号
     * 对于 timed_out，若杀死子进程的过程产生了信号信息，也记录在这里
     */
    int signal = 0;
    bool core_dumped = false;

    /**
     * @brief platform_fault 的名字，例如 ACCESS_VIOLATION
     */
    std::string fault_name;

    /**
     * @brief timed_out 时配置的超时时间（秒）
     */
    double timeout = 0;
};

/**
 * @brief 对正常结束（未超时）的子进程分类
 */
outcome classify(const termination_info &info);

/**
 * @brief 对因超时被杀死的子进程分类
 * @param info 杀死子进程后回收得到的信息
 * @param timeout 配置的超时时间（秒）
 */
outcome classify_timeout(const termination_info &info, double timeout);

/**
 * @brief 单行的结束描述，正常退出时为空
 * 对于 timed_out，返回的是杀死子进程时得到的信号描述（可能为空）
 */
std::string describe(const outcome &result);

/**
 * @brief 需要输出到标准错误流的全部行，超时信息总在信号信息之前
 */
std::vector<std::string> report_lines(const outcome &result);

/**
 * @brief end 日志行的结尾，例如 ", exit code 1"、", signal 11"
 */
std::string outcome_suffix(const outcome &result);

/**
 * @brief testrunner 进程自身的退出码
 */
int exit_code_for(const outcome &result);

}  // namespace testrunner
