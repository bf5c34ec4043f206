#pragma once

#include <ostream>
#include "testrunner/options.hpp"

namespace testrunner {

/**
 * @brief 把 testrunner 自己的选项与子进程的命令行分开
 *
 * 选项解析在第一个单独的 "--" 或者第一个不以 '-' 开头的参数处停止，
 * 之后的所有参数（包括形如 --help 的参数）都原样属于子进程命令行。
 *
 * @param args 不包含 argv[0] 的参数列表
 * @return 解析结果；若出现 --help，help 为真且 command 可能为空
 * @throw argument_error 选项非法，或者没有给出命令
 */
invocation parse_arguments(const std::vector<std::string> &args);

invocation parse_arguments(int argc, const char *argv[]);

/**
 * @brief 输出 usage 和选项说明
 */
void print_usage(std::ostream &os);

/**
 * @brief 只输出一行 usage，用于参数错误时
 */
void print_usage_line(std::ostream &os);

}  // namespace testrunner
