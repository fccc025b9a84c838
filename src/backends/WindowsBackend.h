#pragma once

#include "Backend.h"
#include "platform/windows/ScopedHandle.h"
#include <cstdint>
#include <windows.h>

namespace pedbg {

// Reads the target through ReadProcessMemory
class LiveMemorySource : public MemorySource {
public:
    void setProcess(HANDLE h) { process = h; }

    std::vector<uint8_t> readRawMemory(Address address, size_t size) const override;

private:
    HANDLE process{NULL};
};

class WindowsBackend : public Backend {
public:
    WindowsBackend() = default;
    ~WindowsBackend() override = default;

    Status launch(const std::vector<std::string> &argv) override;

    Status waitForDebugEvent(DebugEventContext &context, DebugEvent &event) override;
    Status continueDebugEvent(const DebugEventContext &context, ContinueStatus status) override;

    Status getRegisters(ThreadId tid, Registers &out) override;
    Status setRegisters(ThreadId tid, const Registers &regs) override;

    const MemorySource &memory() const override { return liveMemory; }

private:
    pedbg_internal::ScopedHandle process;
    LiveMemorySource liveMemory;

    Status fail(const std::string &what);
    std::optional<std::string> imageNameFor(HANDLE file, void *namePointer, WORD unicode) const;
    bool captureThreadContext(ThreadId tid, CONTEXT &ctx, pedbg_internal::ScopedHandle &thread);
    static void contextToRegisters(const CONTEXT &ctx, Registers &out);
    static void registersToContext(const Registers &regs, CONTEXT &ctx);
};

} // namespace pedbg
