#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace testrunner {

/**
 * @brief testrunner 自身的错误，在 execute() 中转换为退出码和一行诊断信息
 * 子进程的结束方式（非零退出、信号、超时）不是错误，不使用异常
 */
struct testrunner_exception : std::exception {
    testrunner_exception();
    explicit testrunner_exception(const std::string &message);

    /**
     * @brief testrunner 因为该错误退出时使用的退出码，默认为 E_INTERNAL_ERROR
     */
    virtual int exit_code() const noexcept;

    /**
     * @brief 输出到标准错误流的诊断信息（不包含 "testrunner: " 前缀）
     */
    virtual std::string diagnostic() const;

    friend std::ostream &operator<<(std::ostream &os, const testrunner_exception &ex);

    template <typename T>
    testrunner_exception operator<<(const T &t) const {
        return testrunner_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 命令行参数错误，在启动子进程之前抛出
 * 例如未知的选项、缺少命令、非法的超时时间
 */
struct argument_error : public testrunner_exception {
    argument_error();
    explicit argument_error(const std::string &message);

    int exit_code() const noexcept override;
    std::string diagnostic() const override;
};

/**
 * @brief 配置错误，在启动子进程之前抛出
 * 例如 --chdir 指定的目录不存在
 */
struct configuration_error : public testrunner_exception {
    configuration_error();
    explicit configuration_error(const std::string &message);

    int exit_code() const noexcept override;
    std::string diagnostic() const override;
};

/**
 * @brief 无法启动子进程，例如可执行文件不存在或没有执行权限
 * what() 为操作系统给出的错误信息
 */
struct spawn_error : public testrunner_exception {
    spawn_error(const std::string &command, int err);
    spawn_error(const std::string &command, int err, const std::string &message);

    const std::string &command() const noexcept;
    int error_code() const noexcept;

    /**
     * @brief 找不到可执行文件时为 E_COMMAND_NOT_FOUND，否则为 E_CANNOT_EXECUTE
     */
    int exit_code() const noexcept override;

    /**
     * @brief <command>: <操作系统给出的错误信息>
     */
    std::string diagnostic() const override;

private:
    std::string cmd;
    int err;
};

/**
 * @brief 表示 testrunner 的内部错误
 * 一般是系统调用失败
 */
struct internal_error : public testrunner_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

}  // namespace testrunner
