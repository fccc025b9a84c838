#include "pedbg/Debugger.h"
#include "pedbg/Eval.h"
#include "pedbg/SymbolResolver.h"
#include <cstdio>
#include <istream>
#include <ostream>

#include "backends/Backend.h"

namespace pedbg {

namespace {

std::string describeThread(const DebugEventContext &context) {
    return "process " + formatHex(context.process) + ", thread " + formatHex(context.thread);
}

} // namespace

Debugger::Debugger(std::unique_ptr<Backend> b, std::istream &input, std::ostream &output)
    : backend(std::move(b)), in(input), out(output) {
}

Debugger::~Debugger() = default;

void Debugger::setLogCallback(std::function<void(const std::string &)> cb) {
    log = cb;
    if (backend) backend->setLogCallback(std::move(cb));
}

const ThreadState *Debugger::getThreadState(ProcessId pid, ThreadId tid) const {
    auto it = threadStates.find(ThreadKey(pid, tid));
    return it == threadStates.end() ? nullptr : &it->second;
}

Status Debugger::launch(const std::vector<std::string> &argv) {
    if (!openSymbols) {
        openSymbols = defaultSymbolStoreOpener(symbolOptions, log);
    }

    Status status = backend->launch(argv);
    if (status != Status::Ok) {
        lastError = backend->getLastError();
    }
    return status;
}

Status Debugger::protocolViolation(const std::string &message) {
    lastError = message;
    if (log) log("(session) " + message);
    return Status::ProtocolViolation;
}

Status Debugger::registerThread(const DebugEventContext &context) {
    ThreadKey key(context.process, context.thread);
    if (threadStates.count(key)) {
        return protocolViolation("Thread registered twice: " + describeThread(context));
    }
    threadStates.emplace(key, ThreadState{});
    process.addThread(context.thread);
    return Status::Ok;
}

Status Debugger::unregisterThread(const DebugEventContext &context) {
    auto it = threadStates.find(ThreadKey(context.process, context.thread));
    if (it == threadStates.end()) {
        return protocolViolation("Exit of unknown " + describeThread(context));
    }
    threadStates.erase(it);
    process.removeThread(context.thread);
    return Status::Ok;
}

void Debugger::loadModule(Address base, const std::optional<std::string> &nameHint) {
    std::string error;
    Module *module = nullptr;
    Status status = process.loadModule(base, nameHint, backend->memory(), openSymbols, error, &module);

    out << "LoadModule: " << formatHex(base) << "   " << module->name << "\n";

    if (status != Status::Ok) {
        out << "  Failed to parse module image: " << error << "\n";
    }
    if (log && !module->symbols) {
        log("(session) no symbols for " + module->name + ": " + module->symbolError);
    }
}

Status Debugger::handleEvent(const DebugEventContext &context, const DebugEvent &event, ContinueStatus &continueStatus) {
    switch (event.kind) {
    case DebugEventKind::Exception: {
        const char *chance = event.firstChance ? "first chance" : "second chance";
        auto it = threadStates.find(ThreadKey(context.process, context.thread));
        if (it == threadStates.end()) {
            return protocolViolation("Exception code " + formatHex(event.exceptionCode) + " (" + chance +
                                     ") for unknown " + describeThread(context));
        }

        // The first single-step exception after a step is our own trap
        ThreadState &state = it->second;
        if (state.expectStepException && event.exceptionCode == kExceptionSingleStep) {
            state.expectStepException = false;
        } else {
            out << "Exception code " << formatHex(event.exceptionCode) << " (" << chance << ")\n";
            continueStatus = ContinueStatus::ExceptionNotHandled;
        }
        return Status::Ok;
    }

    case DebugEventKind::CreateThread:
        out << "CreateThread\n";
        return registerThread(context);

    case DebugEventKind::ExitThread:
        out << "ExitThread code: " << event.exitCode << " process: " << formatHex(context.process)
            << ", thread: " << formatHex(context.thread) << "\n";
        return unregisterThread(context);

    case DebugEventKind::CreateProcess: {
        Status status = registerThread(context);
        if (status != Status::Ok) return status;
        loadModule(event.baseAddress, event.imageName);
        return Status::Ok;
    }

    case DebugEventKind::ExitProcess:
        out << "ExitProcess: code: " << event.exitCode << " process: " << formatHex(context.process) << "\n";
        return unregisterThread(context);

    case DebugEventKind::LoadDll:
        loadModule(event.baseAddress, event.imageName);
        return Status::Ok;

    case DebugEventKind::UnloadDll: {
        out << "UnloadDll: " << formatHex(event.baseAddress);
        if (const Module *module = process.getModuleAtBase(event.baseAddress)) {
            out << "   " << module->name;
        }
        out << "\n";
        return Status::Ok;
    }

    case DebugEventKind::OutputDebugString:
        out << "DebugOut: " << event.debugString << "\n";
        return Status::Ok;

    case DebugEventKind::Rip:
        out << "RipEvent: error: " << event.ripError << ", type: " << event.ripType << "\n";
        return Status::Ok;
    }

    lastError = "Unhandled debug event kind";
    return Status::Error;
}

void Debugger::printLocation(const DebugEventContext &context, const Registers &regs) {
    if (auto symbol = resolveAddressToName(regs.x64.rip, process)) {
        out << "Thread: " << formatHex(context.thread) << " " << *symbol << "\n";
    } else {
        out << "[Thread: " << formatHex(context.thread) << ", IP: " << formatAddress(regs.x64.rip) << "]\n";
    }
}

Status Debugger::interact(const DebugEventContext &context, LoopAction &action) {
    Registers regs;
    if (backend->getRegisters(context.thread, regs) != Status::Ok) {
        lastError = backend->getLastError();
        return Status::Error;
    }

    action = LoopAction::Prompt;
    while (action == LoopAction::Prompt) {
        printLocation(context, regs);
        out << "> " << std::flush;

        std::string line;
        if (!std::getline(in, line)) {
            // End of input quits like `q`
            out << "\n";
            action = LoopAction::Quit;
            break;
        }

        Command command;
        std::vector<Diagnostic> diagnostics;
        ParseOutcome outcome = parseCommand(line, command, diagnostics);
        if (outcome == ParseOutcome::Empty) continue;
        if (outcome == ParseOutcome::Failed) {
            printDiagnostics(out, line, diagnostics);
            continue;
        }

        Status status = executeCommand(command, context, regs, action);
        if (status != Status::Ok) return status;
    }
    return Status::Ok;
}

Status Debugger::executeCommand(const Command &command, const DebugEventContext &context, Registers &regs, LoopAction &action) {
    EvalContext evalContext{&process};
    uint64_t value = 0;
    std::string error;

    // Commands with an operand evaluate it first; a failure only aborts the command
    if (command.expr) {
        if (evaluateExpression(*command.expr, evalContext, value, error) != Status::Ok) {
            out << error << "\n";
            return Status::Ok;
        }
    }

    switch (command.kind) {
    case CommandKind::Help:
        printCommandHelp(out);
        break;

    case CommandKind::Step: {
        auto it = threadStates.find(ThreadKey(context.process, context.thread));
        if (it == threadStates.end()) {
            return protocolViolation("Cannot step because of missing thread state for " + describeThread(context));
        }
        regs.x64.rflags |= kTrapFlag;
        if (backend->setRegisters(context.thread, regs) != Status::Ok) {
            lastError = backend->getLastError();
            return Status::Error;
        }
        it->second.expectStepException = true;
        action = LoopAction::Resume;
        break;
    }

    case CommandKind::Continue:
        action = LoopAction::Resume;
        break;

    case CommandKind::DisplayRegisters:
        regs.x64.print(out);
        break;

    case CommandKind::DisplayBytes: {
        std::vector<uint8_t> bytes = backend->memory().readRawMemory(value, 16);
        for (uint8_t byte : bytes) {
            char text[4];
            std::snprintf(text, sizeof(text), "%02X ", byte);
            out << text;
        }
        out << "\n";
        break;
    }

    case CommandKind::Evaluate:
        out << " = " << formatHex(value) << "\n";
        break;

    case CommandKind::ListNearest:
        if (auto symbol = resolveAddressToName(value, process)) {
            out << *symbol << "\n";
        } else {
            out << "No symbol found\n";
        }
        break;

    case CommandKind::AddBreakpoint: {
        uint32_t id = 0;
        if (breakpoints.add(value, id, error) != Status::Ok) {
            out << error << "\n";
            break;
        }
        out << "Breakpoint " << id << " at " << formatAddress(value) << "\n";
        break;
    }

    case CommandKind::RemoveBreakpoint:
        // Ids never reach kMaxBreakpoints, so larger values match nothing
        if (value < BreakpointManager::kMaxBreakpoints) {
            breakpoints.remove(static_cast<uint32_t>(value));
        }
        break;

    case CommandKind::ListBreakpoints:
        breakpoints.list(process, out);
        break;

    case CommandKind::Quit:
        // The target dies with us since it is never detached
        action = LoopAction::Quit;
        break;
    }
    return Status::Ok;
}

Status Debugger::run() {
    while (true) {
        DebugEventContext context;
        DebugEvent event;
        if (backend->waitForDebugEvent(context, event) != Status::Ok) {
            lastError = backend->getLastError();
            return Status::Error;
        }

        ContinueStatus continueStatus = ContinueStatus::Continue;
        Status status = handleEvent(context, event, continueStatus);
        if (status != Status::Ok) return status;

        if (event.kind == DebugEventKind::ExitProcess) {
            if (backend->continueDebugEvent(context, continueStatus) != Status::Ok) {
                lastError = backend->getLastError();
                return Status::Error;
            }
            return Status::Ok;
        }

        LoopAction action = LoopAction::Prompt;
        status = interact(context, action);
        if (status != Status::Ok) return status;
        if (action == LoopAction::Quit) {
            if (log) log("(session) quit");
            return Status::Ok;
        }

        if (backend->continueDebugEvent(context, continueStatus) != Status::Ok) {
            lastError = backend->getLastError();
            return Status::Error;
        }
    }
}

} // namespace pedbg
