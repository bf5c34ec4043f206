#pragma once

#include <string>
#include <vector>

namespace testrunner {

/**
 * @brief --timeout 的值，单位为秒，允许小数
 */
struct timeout_limit {
    double seconds = 0;
};

/**
 * @brief 一次 testrunner 调用的全部输入，解析完成后不再修改
 */
struct invocation {
    bool help = false;
    bool verbose = false;

    /**
     * @brief 生命周期日志中显示的名字，为空时使用命令的文件名
     */
    std::string label;

    bool use_timeout = false;
    struct timeout_limit timeout;

    /**
     * @brief 启动子进程前切换到的工作目录，为空时不切换
     */
    std::string chdir;

    /**
     * @brief 子进程的 argv，原样传给子进程
     */
    std::vector<std::string> command;
};

}  // namespace testrunner
