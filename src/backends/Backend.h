#pragma once

#include "pedbg/Types.h"
#include "pedbg/DebugEvent.h"
#include "pedbg/MemorySource.h"
#include <functional>
#include <string>
#include <vector>

namespace pedbg {

// OS debug API used by the session controller. All calls block; the target
// is stopped between waitForDebugEvent and continueDebugEvent.
class Backend {
public:
    virtual ~Backend() = default;

    // Start argv[0] with the remaining arguments under the debugger
    virtual Status launch(const std::vector<std::string> &argv) = 0;

    virtual Status waitForDebugEvent(DebugEventContext &context, DebugEvent &event) = 0;
    virtual Status continueDebugEvent(const DebugEventContext &context, ContinueStatus status) = 0;

    virtual Status getRegisters(ThreadId tid, Registers &out) = 0;
    virtual Status setRegisters(ThreadId tid, const Registers &regs) = 0;

    // Memory of the launched target
    virtual const MemorySource &memory() const = 0;

    // Description of the last failed call
    const std::string &getLastError() const { return lastError; }

    void setLogCallback(std::function<void(const std::string &)> cb) { log = std::move(cb); }

protected:
    std::function<void(const std::string &)> log;
    std::string lastError;
};

} // namespace pedbg
