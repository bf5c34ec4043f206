#pragma once

#include <chrono>
#include <ostream>
#include <string>
#include <vector>
#include "testrunner/outcome.hpp"

namespace testrunner {

/**
 * @brief 命令的文件名，作为默认的 label
 */
std::string default_label(const std::vector<std::string> &command);

/**
 * @brief 把 label 中的 ':' 替换为 "__"，':' 是日志行的字段分隔符
 */
std::string sanitize_label(const std::string &label);

/**
 * @brief 实际显示的 label：给定的 label 或者默认 label，已经过 sanitize_label
 */
std::string effective_label(const std::string &label, const std::vector<std::string> &command);

/**
 * @brief <prefix>: begin <label> @<timestamp>: [<child-kind>] <command>
 */
std::string begin_line(const std::string &label,
                       std::chrono::system_clock::time_point when,
                       const std::vector<std::string> &command);

/**
 * @brief <prefix>: end <label>: <elapsed>s<outcome-suffix>
 */
std::string end_line(const std::string &label, double elapsed, const outcome &result);

/**
 * @brief verbose 模式下输出 begin/end 标记，非 verbose 时什么也不做
 * begin 在启动子进程之前写出，end 在回收子进程之后写出，不会与子进程的输出交错
 */
class lifecycle_logger {
public:
    lifecycle_logger(std::ostream &os, bool enabled, std::string label);

    void begin(const std::vector<std::string> &command);
    void end(double elapsed, const outcome &result);

    const std::string &label() const;

private:
    std::ostream &os;
    bool enabled;
    std::string display_label;
};

}  // namespace testrunner
