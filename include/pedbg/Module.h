// Module - one executable image loaded in the target
#pragma once

#include "Types.h"
#include "MemorySource.h"
#include "SymbolStore.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pedbg {

enum class ExportTargetKind {
    Rva,        // code address (already rebased by the module address)
    Forwarder   // "OtherModule.Function" in a different DLL
};

struct Export {
    std::optional<std::string> name;
    uint32_t ordinal{0};                 // biased ordinal (directory base + index)
    ExportTargetKind kind{ExportTargetKind::Rva};
    Address address{0};                  // valid for Rva targets
    std::string forwarder;               // valid for Forwarder targets

    bool isForwarder() const { return kind == ExportTargetKind::Forwarder; }

    // Name, or "Ordinal<N>" for unnamed exports
    std::string displayName() const;
};

struct Module {
    std::string name;
    Address address{0};
    uint64_t size{0};
    std::vector<Export> exports;

    std::optional<CodeViewInfo> codeView;
    std::unique_ptr<SymbolStore> symbols;  // null when no symbol file could be opened
    std::string symbolError;               // why `symbols` is null
    std::string loadError;                 // set when the image headers could not be fully parsed

    bool containsAddress(Address addr) const { return address <= addr && addr - address < size; }
};

// "module_<HEX>" name used when neither the load event nor the export
// directory provides one
std::string defaultModuleName(Address address);

// Parse the image loaded at `address` purely from target memory.
// On failure `out` still holds everything read before the failure (name,
// range, debug info) and `error` describes what went wrong.
Status parseModule(Address address,
                   const std::optional<std::string>& nameHint,
                   const MemorySource& memory,
                   const SymbolStoreOpener& openSymbols,
                   Module& out,
                   std::string& error);

} // namespace pedbg
