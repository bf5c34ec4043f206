#pragma once

#include <cstdint>

namespace testrunner {

/**
 * @brief 查找 Windows 异常退出码（NTSTATUS）对应的名字
 * @param code 子进程的原始退出码，例如 0xC0000005
 * @return 名字（例如 "ACCESS_VIOLATION"），未知退出码返回 nullptr
 */
const char *fault_name(uint32_t code);

}  // namespace testrunner
