// small, common types for pedbg
#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include "arch/X64Registers.h"

namespace pedbg {

enum class Status {
    Ok,
    Error,
    NotAttached,
    AlreadyAttached,
    NotFound,
    NotSupported,
    ProtocolViolation   // debugger state no longer matches what the OS reports
};

using Address = uint64_t;
using ThreadId = uint32_t;
using ProcessId = uint32_t;

struct Breakpoint {
    uint32_t id{0};
    Address address{0};
};

struct Registers {
    X64Registers x64{};
};

// "0x1f" style
inline std::string formatHex(uint64_t value) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "0x%llx", static_cast<unsigned long long>(value));
    return buf;
}

// "0x000000000000001f" style
inline std::string formatAddress(Address value) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "0x%016llx", static_cast<unsigned long long>(value));
    return buf;
}

} // namespace pedbg
