#pragma once

#include <filesystem>

namespace testrunner {

/**
 * @brief testrunner 自身使用的退出码
 * 子进程正常退出时直接使用子进程的退出码，其余情况使用下面的值
 */
enum error_codes {
    E_SUCCESS = 0,
    E_INTERNAL_ERROR = 1,
    E_USAGE = 2,
    E_CONFIGURATION = 3,

    E_TIMEOUT = 124,
    E_CANNOT_EXECUTE = 126,
    E_COMMAND_NOT_FOUND = 127,

    /**
     * @brief 子进程因为信号 N 终止时，退出码为 E_SIGNAL_BASE + N
     */
    E_SIGNAL_BASE = 128
};

/**
 * @brief 子进程运行时间与超时时间之差小于超时时间的这个比例时输出警告
 * 即运行时间 >= (1 - TIMEOUT_WARNING_MARGIN) * timeout 时警告
 */
extern const double TIMEOUT_WARNING_MARGIN;

/**
 * @brief --timeout 允许的最大值（秒），约 31 年
 * 更大的值无法用 steady_clock 的纳秒计数表示
 */
extern const double MAX_TIMEOUT;

/**
 * @brief 生命周期日志的前缀，同时也是错误信息的前缀
 */
extern const char *LOG_PREFIX;

/**
 * @brief 生命周期 begin 行中 [] 内的子进程类型标签
 */
extern const char *CHILD_KIND;

/**
 * @brief glog 日志文件目录，来自环境变量 TESTRUNNER_LOG_DIR
 * 为空时不生成日志文件
 */
extern std::filesystem::path LOG_DIR;

/**
 * @brief 来自环境变量 TESTRUNNER_DEBUG，为真时 glog 直接输出到标准错误流
 */
extern bool DEBUG;

/**
 * @brief 从环境变量读取 LOG_DIR 与 DEBUG
 */
void load_environment();

/**
 * @brief 初始化 glog
 * 标准错误流是 testrunner 输出协议的一部分，默认情况下 glog 不能写入标准错误流
 */
void init_logging(const char *argv0);

}  // namespace testrunner
