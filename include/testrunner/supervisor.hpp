#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "testrunner/options.hpp"
#include "testrunner/outcome.hpp"

namespace testrunner {

/**
 * @brief supervisor 的状态
 * idle → parsed → (chdir_applied) → launched → racing → terminated → reported
 */
enum class supervisor_state {
    idle,
    parsed,
    chdir_applied,
    launched,
    racing,
    terminated,
    reported
};

const char *state_name(supervisor_state state);

/**
 * @brief 运行一个子进程并报告它的结束方式
 *
 * 1. 必要时切换工作目录
 * 2. verbose 时输出 begin 标记
 * 3. 启动子进程，命令行原样传递，标准输入输出直接继承
 * 4. 同时等待子进程结束和超时，超时时终止子进程
 * 5. 回收子进程并分类结束方式，输出警告、超时、信号等信息
 * 6. verbose 时输出 end 标记，返回 testrunner 的退出码
 *
 * 所有 testrunner 自己的输出都写入构造时传入的流（通常是标准错误流）。
 */
class supervisor {
public:
    supervisor(const invocation &inv, std::ostream &err);

    /**
     * @brief 执行上面的全部步骤，每个 supervisor 只能调用一次
     * @return testrunner 的退出码
     * @throw configuration_error 工作目录无效
     * @throw spawn_error 无法启动子进程
     * @throw internal_error 系统调用失败
     */
    int run();

    supervisor_state state() const;

    /**
     * @brief 子进程的结束方式，state() 为 reported 之后有效
     */
    const outcome &result() const;

    /**
     * @brief 子进程从启动到回收经过的秒数
     */
    double elapsed() const;

    const std::string &label() const;

private:
    const invocation &inv;
    std::ostream &err;
    std::string display_label;
    supervisor_state current = supervisor_state::idle;
    outcome final_outcome;
    double elapsed_seconds = 0;

    void transition(supervisor_state next);
    void write_lines(const std::vector<std::string> &lines);
};

/**
 * @brief testrunner 的完整入口：解析参数、运行子进程、把错误转换为退出码
 * @param args 不包含 argv[0] 的参数列表
 * @param out --help 的输出
 * @param err testrunner 自己的诊断输出
 */
int execute(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);

}  // namespace testrunner
