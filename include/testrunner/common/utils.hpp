#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace testrunner {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量，测试中用于构造 TESTRUNNER_* 配置
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 把命令行以空格连接起来，仅用于日志显示，不用于执行
 */
std::string join_command(const std::vector<std::string> &command);

/**
 * @brief 单调时钟计时器，不受系统时间调整影响
 */
struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace testrunner
