#include "WindowsBackend.h"
#include "platform/Platform.h"
#include <algorithm>
#include <cstring>

namespace pedbg {

namespace {

constexpr size_t kPageSize = 0x1000;
constexpr size_t kMaxImageNameLength = MAX_PATH;

// Quote an argument the way CommandLineToArgvW splits it again
std::string quoteArgument(const std::string &arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) return arg;

    std::string quoted = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
            continue;
        }
        if (c == '"') quoted.append(backslashes * 2 + 1, '\\');
        else quoted.append(backslashes, '\\');
        backslashes = 0;
        quoted += c;
    }
    quoted.append(backslashes * 2, '\\');
    quoted += '"';
    return quoted;
}

std::string fileNameOf(const std::string &path) {
    size_t lastSlash = path.find_last_of("\\/");
    return lastSlash == std::string::npos ? path : path.substr(lastSlash + 1);
}

const char *eventName(DWORD code) {
    switch (code) {
    case EXCEPTION_DEBUG_EVENT: return "EXCEPTION";
    case CREATE_THREAD_DEBUG_EVENT: return "CREATE_THREAD";
    case CREATE_PROCESS_DEBUG_EVENT: return "CREATE_PROCESS";
    case EXIT_THREAD_DEBUG_EVENT: return "EXIT_THREAD";
    case EXIT_PROCESS_DEBUG_EVENT: return "EXIT_PROCESS";
    case LOAD_DLL_DEBUG_EVENT: return "LOAD_DLL";
    case UNLOAD_DLL_DEBUG_EVENT: return "UNLOAD_DLL";
    case OUTPUT_DEBUG_STRING_EVENT: return "OUTPUT_DEBUG_STRING";
    case RIP_EVENT: return "RIP";
    default: return "UNKNOWN";
    }
}

} // namespace

std::vector<uint8_t> LiveMemorySource::readRawMemory(Address address, size_t size) const {
    std::vector<uint8_t> out;
    uint8_t page[kPageSize];

    // Page by page so an unreadable page only cuts off the tail. The result
    // grows with what was read; `size` may come from a corrupt header.
    while (out.size() < size) {
        Address current = address + out.size();
        size_t chunk = std::min(size - out.size(), kPageSize - static_cast<size_t>(current % kPageSize));
        SIZE_T read = 0;
        BOOL ok = ReadProcessMemory(process, reinterpret_cast<LPCVOID>(current), page, chunk, &read);
        out.insert(out.end(), page, page + read);
        if (!ok || read != chunk) break;
    }

    return out;
}

Status WindowsBackend::fail(const std::string &what) {
    lastError = what + ": " + pedbg_internal::lastErrorMessage();
    if (log) log("(windows) " + lastError);
    return Status::Error;
}

Status WindowsBackend::launch(const std::vector<std::string> &argv) {
    if (process) return Status::AlreadyAttached;
    if (argv.empty()) {
        lastError = "No program to launch";
        return Status::Error;
    }

    std::string cmd;
    for (const auto &arg : argv) {
        if (!cmd.empty()) cmd += " ";
        cmd += quoteArgument(arg);
    }

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    // CreateProcessA may modify the command line buffer
    std::vector<char> cmdBuffer(cmd.begin(), cmd.end());
    cmdBuffer.push_back('\0');

    if (!CreateProcessA(nullptr, cmdBuffer.data(), nullptr, nullptr, FALSE,
                        DEBUG_ONLY_THIS_PROCESS | CREATE_NEW_CONSOLE, nullptr, nullptr, &si, &pi)) {
        return fail("CreateProcess failed for " + cmd);
    }

    process.reset(pi.hProcess);
    pedbg_internal::ScopedHandle mainThread(pi.hThread);
    liveMemory.setProcess(process.get());

    if (log) log("(windows) launched " + cmd + " (pid=" + std::to_string(pi.dwProcessId) + ")");
    return Status::Ok;
}

std::optional<std::string> WindowsBackend::imageNameFor(HANDLE file, void *namePointer, WORD unicode) const {
    if (file) {
        char path[MAX_PATH * 2] = {0};
        DWORD length = GetFinalPathNameByHandleA(file, path, sizeof(path), FILE_NAME_NORMALIZED);
        if (length > 0 && length < sizeof(path)) {
            return fileNameOf(std::string(path, length));
        }
    }

    // lpImageName points at a pointer to the name in the target; both may be null
    if (namePointer) {
        std::string name = readMemoryStringIndirect(liveMemory, reinterpret_cast<Address>(namePointer),
                                                    kMaxImageNameLength, unicode != 0);
        if (!name.empty()) return fileNameOf(name);
    }
    return std::nullopt;
}

Status WindowsBackend::waitForDebugEvent(DebugEventContext &context, DebugEvent &event) {
    DEBUG_EVENT ev = {};
    if (!WaitForDebugEventEx(&ev, INFINITE)) {
        return fail("WaitForDebugEvent failed");
    }

    if (log) {
        log(std::string("(windows) event=") + eventName(ev.dwDebugEventCode) +
            " pid=" + std::to_string(ev.dwProcessId) + " tid=" + std::to_string(ev.dwThreadId));
    }

    context.process = static_cast<ProcessId>(ev.dwProcessId);
    context.thread = static_cast<ThreadId>(ev.dwThreadId);
    event = DebugEvent{};

    switch (ev.dwDebugEventCode) {
    case EXCEPTION_DEBUG_EVENT: {
        const auto &record = ev.u.Exception.ExceptionRecord;
        event.kind = DebugEventKind::Exception;
        event.firstChance = ev.u.Exception.dwFirstChance != 0;
        event.exceptionCode = static_cast<uint32_t>(record.ExceptionCode);
        break;
    }
    case CREATE_PROCESS_DEBUG_EVENT: {
        // The file handle is ours to close; process/thread handles belong to the system
        pedbg_internal::ScopedHandle file(ev.u.CreateProcessInfo.hFile);
        event.kind = DebugEventKind::CreateProcess;
        event.baseAddress = reinterpret_cast<Address>(ev.u.CreateProcessInfo.lpBaseOfImage);
        event.imageName = imageNameFor(file.get(), ev.u.CreateProcessInfo.lpImageName, ev.u.CreateProcessInfo.fUnicode);
        break;
    }
    case EXIT_PROCESS_DEBUG_EVENT:
        event.kind = DebugEventKind::ExitProcess;
        event.exitCode = ev.u.ExitProcess.dwExitCode;
        break;
    case CREATE_THREAD_DEBUG_EVENT:
        event.kind = DebugEventKind::CreateThread;
        break;
    case EXIT_THREAD_DEBUG_EVENT:
        event.kind = DebugEventKind::ExitThread;
        event.exitCode = ev.u.ExitThread.dwExitCode;
        break;
    case LOAD_DLL_DEBUG_EVENT: {
        pedbg_internal::ScopedHandle file(ev.u.LoadDll.hFile);
        event.kind = DebugEventKind::LoadDll;
        event.baseAddress = reinterpret_cast<Address>(ev.u.LoadDll.lpBaseOfDll);
        event.imageName = imageNameFor(file.get(), ev.u.LoadDll.lpImageName, ev.u.LoadDll.fUnicode);
        break;
    }
    case UNLOAD_DLL_DEBUG_EVENT:
        event.kind = DebugEventKind::UnloadDll;
        event.baseAddress = reinterpret_cast<Address>(ev.u.UnloadDll.lpBaseOfDll);
        break;
    case OUTPUT_DEBUG_STRING_EVENT: {
        const auto &info = ev.u.DebugString;
        event.kind = DebugEventKind::OutputDebugString;
        event.debugString = readMemoryString(liveMemory, reinterpret_cast<Address>(info.lpDebugStringData),
                                             info.nDebugStringLength, info.fUnicode != 0);
        break;
    }
    case RIP_EVENT:
        event.kind = DebugEventKind::Rip;
        event.ripError = ev.u.RipInfo.dwError;
        event.ripType = ev.u.RipInfo.dwType;
        break;
    default:
        lastError = "Unknown debug event code " + std::to_string(ev.dwDebugEventCode);
        return Status::Error;
    }

    return Status::Ok;
}

Status WindowsBackend::continueDebugEvent(const DebugEventContext &context, ContinueStatus status) {
    DWORD continueStatus = status == ContinueStatus::Continue ? DBG_CONTINUE : DBG_EXCEPTION_NOT_HANDLED;
    if (!ContinueDebugEvent(context.process, context.thread, continueStatus)) {
        return fail("ContinueDebugEvent failed");
    }
    return Status::Ok;
}

bool WindowsBackend::captureThreadContext(ThreadId tid, CONTEXT &ctx, pedbg_internal::ScopedHandle &thread) {
    thread.reset(OpenThread(THREAD_GET_CONTEXT | THREAD_SET_CONTEXT | THREAD_QUERY_INFORMATION, FALSE, tid));
    if (!thread) return false;

    std::memset(&ctx, 0, sizeof(ctx));
    ctx.ContextFlags = CONTEXT_ALL;
    return GetThreadContext(thread.get(), &ctx) != 0;
}

Status WindowsBackend::getRegisters(ThreadId tid, Registers &out) {
    pedbg_internal::ScopedHandle thread;
    CONTEXT ctx;
    if (!captureThreadContext(tid, ctx, thread)) {
        return fail("Could not read the context of thread " + std::to_string(tid));
    }
    contextToRegisters(ctx, out);
    return Status::Ok;
}

Status WindowsBackend::setRegisters(ThreadId tid, const Registers &regs) {
    pedbg_internal::ScopedHandle thread;
    CONTEXT ctx;
    if (!captureThreadContext(tid, ctx, thread)) {
        return fail("Could not read the context of thread " + std::to_string(tid));
    }
    registersToContext(regs, ctx);
    if (!SetThreadContext(thread.get(), &ctx)) {
        return fail("Could not write the context of thread " + std::to_string(tid));
    }
    return Status::Ok;
}

void WindowsBackend::contextToRegisters(const CONTEXT &ctx, Registers &out) {
    auto &r = out.x64;
    r.rip = ctx.Rip;
    r.rsp = ctx.Rsp;
    r.rbp = ctx.Rbp;
    r.rflags = ctx.EFlags;
    r.rax = ctx.Rax;
    r.rbx = ctx.Rbx;
    r.rcx = ctx.Rcx;
    r.rdx = ctx.Rdx;
    r.rsi = ctx.Rsi;
    r.rdi = ctx.Rdi;
    r.r8  = ctx.R8;
    r.r9  = ctx.R9;
    r.r10 = ctx.R10;
    r.r11 = ctx.R11;
    r.r12 = ctx.R12;
    r.r13 = ctx.R13;
    r.r14 = ctx.R14;
    r.r15 = ctx.R15;
    r.cs = static_cast<uint16_t>(ctx.SegCs);
    r.ds = static_cast<uint16_t>(ctx.SegDs);
    r.es = static_cast<uint16_t>(ctx.SegEs);
    r.fs = static_cast<uint16_t>(ctx.SegFs);
    r.gs = static_cast<uint16_t>(ctx.SegGs);
    r.ss = static_cast<uint16_t>(ctx.SegSs);
    r.dr0 = ctx.Dr0;
    r.dr1 = ctx.Dr1;
    r.dr2 = ctx.Dr2;
    r.dr3 = ctx.Dr3;
    r.dr6 = ctx.Dr6;
    r.dr7 = ctx.Dr7;
}

// Only the integer and control registers are written back; segment and
// debug registers keep their current values.
void WindowsBackend::registersToContext(const Registers &regs, CONTEXT &ctx) {
    const auto &r = regs.x64;
    ctx.Rip = r.rip;
    ctx.Rsp = r.rsp;
    ctx.Rbp = r.rbp;
    ctx.EFlags = static_cast<DWORD>(r.rflags);
    ctx.Rax = r.rax;
    ctx.Rbx = r.rbx;
    ctx.Rcx = r.rcx;
    ctx.Rdx = r.rdx;
    ctx.Rsi = r.rsi;
    ctx.Rdi = r.rdi;
    ctx.R8  = r.r8;
    ctx.R9  = r.r9;
    ctx.R10 = r.r10;
    ctx.R11 = r.r11;
    ctx.R12 = r.r12;
    ctx.R13 = r.r13;
    ctx.R14 = r.r14;
    ctx.R15 = r.r15;
}

} // namespace pedbg
