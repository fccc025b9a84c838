// Debug events as reported by the OS debug API
#pragma once

#include "Types.h"
#include <optional>
#include <string>

namespace pedbg {

// Raised by the CPU after one instruction when the trap flag is set
constexpr uint32_t kExceptionSingleStep = 0x80000004;
constexpr uint32_t kExceptionBreakpoint = 0x80000003;

enum class DebugEventKind {
    Exception,
    CreateProcess,
    ExitProcess,
    CreateThread,
    ExitThread,
    LoadDll,
    UnloadDll,
    OutputDebugString,
    Rip
};

// Fields are meaningful only for the kinds noted beside them
struct DebugEvent {
    DebugEventKind kind{DebugEventKind::Exception};

    bool firstChance{false};                // Exception
    uint32_t exceptionCode{0};              // Exception

    std::optional<std::string> imageName;   // CreateProcess, LoadDll
    Address baseAddress{0};                 // CreateProcess, LoadDll, UnloadDll

    uint32_t exitCode{0};                   // ExitProcess, ExitThread

    std::string debugString;                // OutputDebugString

    uint32_t ripError{0};                   // Rip
    uint32_t ripType{0};                    // Rip
};

// Identifies the process/thread an event belongs to; needed to continue it
struct DebugEventContext {
    ProcessId process{0};
    ThreadId thread{0};
};

// How the target should treat the event it is released from
enum class ContinueStatus {
    Continue,              // exception handled by the debugger
    ExceptionNotHandled    // let the target's own handlers see it
};

} // namespace pedbg
