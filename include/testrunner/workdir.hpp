#pragma once

#include <filesystem>

namespace testrunner {

/**
 * @brief 切换 testrunner 自身的工作目录，子进程随后继承这个目录
 * @param dir --chdir 指定的目录
 * @throw configuration_error 目录不存在、不是目录或者无法进入
 */
void change_working_directory(const std::filesystem::path &dir);

}  // namespace testrunner
