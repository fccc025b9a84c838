// DbgHelp-backed symbol store for Windows
#pragma once

#include "pedbg/SymbolStore.h"
#include <windows.h>
#include <functional>
#include <memory>
#include <string>

namespace pedbg {

class DbgHelpSymbolStore : public SymbolStore {
public:
    ~DbgHelpSymbolStore() override;

    DbgHelpSymbolStore(const DbgHelpSymbolStore&) = delete;
    DbgHelpSymbolStore& operator=(const DbgHelpSymbolStore&) = delete;

    // Load the PDB at `path` into a private DbgHelp session. With
    // options.exactSymbols the PDB's GUID/age must match `info`.
    static std::unique_ptr<SymbolStore> open(const std::string& path,
                                             const CodeViewInfo& info,
                                             uint64_t imageSize,
                                             const SymbolOptions& options,
                                             std::function<void(const std::string&)> log,
                                             std::string& error);

    const std::string& getPath() const override { return path; }

    Status forEachPublicFunction(const std::function<void(const std::string& name, uint32_t rva)>& fn) override;

private:
    DbgHelpSymbolStore(std::string pdbPath, std::function<void(const std::string&)> logCallback);

    // DbgHelp keys sessions by handle; any unique value works when no
    // process is invaded, so each store uses its own address.
    HANDLE sessionHandle() const { return reinterpret_cast<HANDLE>(const_cast<DbgHelpSymbolStore*>(this)); }

    std::string path;
    std::function<void(const std::string&)> log;
    bool initialized{false};
    DWORD64 loadBase{0};
};

} // namespace pedbg
