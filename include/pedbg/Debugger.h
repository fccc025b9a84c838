// pedbg - interactive debug session over one launched process
#pragma once

#include "Types.h"
#include "BreakpointManager.h"
#include "Command.h"
#include "DebugEvent.h"
#include "Process.h"
#include "SymbolStore.h"
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pedbg {

class Backend;

struct ThreadState {
    // The next single-step exception on this thread comes from our own step
    bool expectStepException{false};
};

// What the interactive loop does after a command
enum class LoopAction {
    Prompt,   // read another command
    Resume,   // continue the pending debug event
    Quit      // end the session without continuing
};

class Debugger {
public:
    // Takes ownership of the backend. Operator commands are read from `in`,
    // everything the operator sees goes to `out`.
    Debugger(std::unique_ptr<Backend> backend, std::istream &in, std::ostream &out);
    ~Debugger();

    Debugger(const Debugger &) = delete;
    Debugger &operator=(const Debugger &) = delete;

    Status launch(const std::vector<std::string> &argv);

    // Event loop: returns Ok when the target exits or the operator quits,
    // Error on a backend failure and ProtocolViolation when the OS reports
    // a thread the session does not know about (or already knows).
    Status run();

    // One event: update threads and modules. `continueStatus` becomes
    // ExceptionNotHandled when the event is an exception the session does not own.
    Status handleEvent(const DebugEventContext &context, const DebugEvent &event, ContinueStatus &continueStatus);

    // Prompt for commands until one resumes the target or quits
    Status interact(const DebugEventContext &context, LoopAction &action);

    Status executeCommand(const Command &command, const DebugEventContext &context, Registers &regs, LoopAction &action);

    // Configuration, before launch
    void setLogCallback(std::function<void(const std::string &)> cb);
    void setSymbolOptions(const SymbolOptions &options) { symbolOptions = options; }
    void setSymbolStoreOpener(SymbolStoreOpener opener) { openSymbols = std::move(opener); }

    Process &getProcess() { return process; }
    BreakpointManager &getBreakpoints() { return breakpoints; }
    const ThreadState *getThreadState(ProcessId pid, ThreadId tid) const;
    const std::string &getLastError() const { return lastError; }

private:
    using ThreadKey = std::pair<ProcessId, ThreadId>;

    std::unique_ptr<Backend> backend;
    std::istream &in;
    std::ostream &out;
    std::function<void(const std::string &)> log;

    Process process;
    BreakpointManager breakpoints;
    std::map<ThreadKey, ThreadState> threadStates;
    SymbolOptions symbolOptions;
    SymbolStoreOpener openSymbols;
    std::string lastError;

    Status registerThread(const DebugEventContext &context);
    Status unregisterThread(const DebugEventContext &context);
    void loadModule(Address base, const std::optional<std::string> &nameHint);
    void printLocation(const DebugEventContext &context, const Registers &regs);
    Status protocolViolation(const std::string &message);
};

} // namespace pedbg
