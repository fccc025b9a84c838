#include "pedbg/Process.h"
#include <algorithm>
#include <cctype>

namespace pedbg {

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Final path component, accepting either separator
static std::string fileNameOf(const std::string& path) {
    size_t lastSlash = path.find_last_of("\\/");
    return lastSlash == std::string::npos ? path : path.substr(lastSlash + 1);
}

Status Process::loadModule(Address address,
                           const std::optional<std::string>& nameHint,
                           const MemorySource& memory,
                           const SymbolStoreOpener& openSymbols,
                           std::string& error,
                           Module** loaded) {
    Module module;
    Status status = parseModule(address, nameHint, memory, openSymbols, module, error);
    if (status != Status::Ok) {
        module.loadError = error;
    }
    Module& added = addModule(std::move(module));
    if (loaded) *loaded = &added;
    return status;
}

Module& Process::addModule(Module module) {
    moduleList.push_back(std::move(module));
    return moduleList.back();
}

Module* Process::getContainingModule(Address address) {
    for (auto it = moduleList.rbegin(); it != moduleList.rend(); ++it) {
        if (it->containsAddress(address)) return &*it;
    }
    return nullptr;
}

Module* Process::getModuleAtBase(Address base) {
    for (auto it = moduleList.rbegin(); it != moduleList.rend(); ++it) {
        if (it->address == base) return &*it;
    }
    return nullptr;
}

Module* Process::getModuleByName(const std::string& moduleName) {
    Module* trimmedMatch = nullptr;
    std::string wanted = toLower(moduleName);

    for (auto& module : moduleList) {
        if (module.name == moduleName) {
            return &module;
        }

        // Keep looking after a trimmed match: an exact match wins even if it comes later
        if (!trimmedMatch) {
            std::string file = toLower(fileNameOf(module.name));
            size_t dot = file.find_last_of('.');
            std::string stem = dot == std::string::npos ? file : file.substr(0, dot);
            if (file == wanted || stem == wanted) {
                trimmedMatch = &module;
            }
        }
    }

    return trimmedMatch;
}

void Process::addThread(ThreadId tid) {
    if (!hasThread(tid)) threadList.push_back(tid);
}

void Process::removeThread(ThreadId tid) {
    threadList.erase(std::remove(threadList.begin(), threadList.end(), tid), threadList.end());
}

bool Process::hasThread(ThreadId tid) const {
    return std::find(threadList.begin(), threadList.end(), tid) != threadList.end();
}

} // namespace pedbg
