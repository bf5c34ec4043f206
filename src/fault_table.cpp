#include "testrunner/fault_table.hpp"

namespace testrunner {

struct fault_entry {
    uint32_t code;
    const char *name;
};

/*
 * NTSTATUS values a crashing Windows process exits with, taken from
 * <ntstatus.h>. Exit codes not listed here are ordinary exit codes.
 */
static const fault_entry fault_table[] = {
    {0x40000015, "FATAL_APP_EXIT"},
    {0x80000002, "DATATYPE_MISALIGNMENT"},
    {0x80000003, "BREAKPOINT"},
    {0x80000004, "SINGLE_STEP"},
    {0xC0000005, "ACCESS_VIOLATION"},
    {0xC0000006, "IN_PAGE_ERROR"},
    {0xC0000008, "INVALID_HANDLE"},
    {0xC000001D, "ILLEGAL_INSTRUCTION"},
    {0xC0000025, "NONCONTINUABLE_EXCEPTION"},
    {0xC0000026, "INVALID_DISPOSITION"},
    {0xC0000028, "BAD_STACK"},
    {0xC000008C, "ARRAY_BOUNDS_EXCEEDED"},
    {0xC000008D, "FLOAT_DENORMAL_OPERAND"},
    {0xC000008E, "FLOAT_DIVIDE_BY_ZERO"},
    {0xC000008F, "FLOAT_INEXACT_RESULT"},
    {0xC0000090, "FLOAT_INVALID_OPERATION"},
    {0xC0000091, "FLOAT_OVERFLOW"},
    {0xC0000092, "FLOAT_STACK_CHECK"},
    {0xC0000093, "FLOAT_UNDERFLOW"},
    {0xC0000094, "INTEGER_DIVIDE_BY_ZERO"},
    {0xC0000095, "INTEGER_OVERFLOW"},
    {0xC0000096, "PRIVILEGED_INSTRUCTION"},
    {0xC00000FD, "STACK_OVERFLOW"},
    {0xC000013A, "CONTROL_C_EXIT"},
    {0xC0000135, "DLL_NOT_FOUND"},
    {0xC0000142, "DLL_INIT_FAILED"},
    {0xC0000374, "HEAP_CORRUPTION"},
    {0xC0000409, "STACK_BUFFER_OVERRUN"},
    {0xC0000417, "INVALID_CRUNTIME_PARAMETER"},
    {0xC0000420, "ASSERTION_FAILURE"},
};

const char *fault_name(uint32_t code) {
    for (const auto &entry : fault_table)
        if (entry.code == code) return entry.name;
    return nullptr;
}

}  // namespace testrunner
