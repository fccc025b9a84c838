// Process - modules and threads of the one attached target
#pragma once

#include "Types.h"
#include "Module.h"
#include <optional>
#include <string>
#include <vector>

namespace pedbg {

class Process {
public:
    Process() = default;
    ~Process() = default;

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    // Parse the image at `address` and register it. A module is registered
    // even when parsing fails; its `loadError` then says why and the return
    // value is the parse status. `loaded`, when given, receives the new module.
    Status loadModule(Address address,
                      const std::optional<std::string>& nameHint,
                      const MemorySource& memory,
                      const SymbolStoreOpener& openSymbols,
                      std::string& error,
                      Module** loaded = nullptr);

    // Takes ownership of an already-built module
    Module& addModule(Module module);

    const std::vector<Module>& modules() const { return moduleList; }

    // Unloaded modules stay registered, so the latest registration wins
    Module* getContainingModule(Address address);
    Module* getModuleAtBase(Address base);

    // Exact name first; otherwise the first module whose file name (with or
    // without extension) matches case-insensitively.
    Module* getModuleByName(const std::string& moduleName);

    // Thread enumeration
    void addThread(ThreadId tid);
    void removeThread(ThreadId tid);
    bool hasThread(ThreadId tid) const;
    const std::vector<ThreadId>& threads() const { return threadList; }

private:
    std::vector<Module> moduleList;   // load order
    std::vector<ThreadId> threadList;
};

} // namespace pedbg
