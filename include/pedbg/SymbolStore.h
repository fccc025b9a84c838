// Symbol store interface - allows plugging in different symbol file readers
#pragma once

#include "Types.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace pedbg {

// Options for symbol loading
struct SymbolOptions {
    std::string searchPath;        // Local directories searched for symbol files (semicolon-separated)
    bool undecorateNames = true;   // Undecorate C++ names
    bool exactSymbols = true;      // Reject symbol files whose GUID/age differ from the image

    // Search path taken from _NT_SYMBOL_PATH, if set
    static SymbolOptions fromEnvironment();
};

// Identifies the symbol file matching one exact build of an image
struct CodeViewInfo {
    uint32_t signature{0};
    uint8_t guid[16]{};
    uint32_t age{0};
    std::string pdbPath;
};

// Abstract interface for an opened symbol file (PDB through DbgHelp, test doubles, ...)
class SymbolStore {
public:
    virtual ~SymbolStore() = default;

    virtual const std::string& getPath() const = 0;

    // Calls `fn` for every public function symbol with its image-relative address.
    virtual Status forEachPublicFunction(const std::function<void(const std::string& name, uint32_t rva)>& fn) = 0;
};

// Opens the symbol file described by a CodeView record. Returns nullptr and
// fills `error` on failure.
using SymbolStoreOpener = std::function<std::unique_ptr<SymbolStore>(const CodeViewInfo& info, uint64_t imageSize, std::string& error)>;

// Find the symbol file on disk: the embedded path first, then the file name in
// each search path directory.
std::optional<std::string> locateSymbolFile(const std::string& pdbPath, const SymbolOptions& options);

// Opener used by the debugger: locateSymbolFile + the platform symbol reader
SymbolStoreOpener defaultSymbolStoreOpener(const SymbolOptions& options,
                                           std::function<void(const std::string&)> log = {});

} // namespace pedbg
