#include "DbgHelpSymbolStore.h"
#include "platform/Platform.h"
#include <DbgHelp.h>
#include <cstring>

#pragma comment(lib, "dbghelp.lib")

// Symbol tags (from cvconst.h in DIA SDK)
#ifndef SymTagPublicSymbol
#define SymTagPublicSymbol 10
#endif
#ifndef SYMFLAG_PUBLIC_CODE
#define SYMFLAG_PUBLIC_CODE 0x00400000
#endif
#ifndef SYMSEARCH_ALLITEMS
#define SYMSEARCH_ALLITEMS 0x08
#endif

namespace pedbg {

namespace {

// Symbol files are mapped at a fixed fake base; only image-relative
// addresses leave this file.
constexpr DWORD64 kPdbLoadBase = 0x10000000;

struct SearchContext {
    DWORD64 base;
    const std::function<void(const std::string&, uint32_t)>* fn;
};

BOOL CALLBACK publicSymbolCallback(PSYMBOL_INFO symInfo, ULONG, PVOID userContext) {
    auto* ctx = static_cast<SearchContext*>(userContext);
    if ((symInfo->Flags & SYMFLAG_PUBLIC_CODE) == 0) return TRUE;
    if (symInfo->Address < ctx->base) return TRUE;

    std::string name(symInfo->Name, symInfo->NameLen);
    (*ctx->fn)(name, static_cast<uint32_t>(symInfo->Address - ctx->base));
    return TRUE;
}

} // namespace

DbgHelpSymbolStore::DbgHelpSymbolStore(std::string pdbPath, std::function<void(const std::string&)> logCallback)
    : path(std::move(pdbPath)), log(std::move(logCallback)) {
}

DbgHelpSymbolStore::~DbgHelpSymbolStore() {
    if (!initialized) return;
    if (loadBase) SymUnloadModule64(sessionHandle(), loadBase);
    SymCleanup(sessionHandle());
}

std::unique_ptr<SymbolStore> DbgHelpSymbolStore::open(const std::string& path,
                                                      const CodeViewInfo& info,
                                                      uint64_t imageSize,
                                                      const SymbolOptions& options,
                                                      std::function<void(const std::string&)> log,
                                                      std::string& error) {
    std::unique_ptr<DbgHelpSymbolStore> store(new DbgHelpSymbolStore(path, std::move(log)));

    DWORD symOpts = SYMOPT_FAIL_CRITICAL_ERRORS | SYMOPT_NO_PROMPTS;
    if (options.undecorateNames) {
        symOpts |= SYMOPT_UNDNAME;
    }
    if (options.exactSymbols) {
        symOpts |= SYMOPT_EXACT_SYMBOLS;
    }
    SymSetOptions(symOpts);

    if (!SymInitialize(store->sessionHandle(), NULL, FALSE)) {
        error = "SymInitialize failed: " + pedbg_internal::lastErrorMessage();
        return nullptr;
    }
    store->initialized = true;

    // The PDB is loaded directly; DbgHelp needs a nonzero base and size for that
    DWORD size = imageSize ? static_cast<DWORD>(imageSize) : 0x1000;
    DWORD64 base = SymLoadModuleEx(store->sessionHandle(), NULL, path.c_str(), NULL,
                                   kPdbLoadBase, size, NULL, 0);
    if (base == 0) {
        error = "Could not load " + path + ": " + pedbg_internal::lastErrorMessage();
        return nullptr;
    }
    store->loadBase = base;

    if (options.exactSymbols) {
        IMAGEHLP_MODULE64 modInfo = {};
        modInfo.SizeOfStruct = sizeof(IMAGEHLP_MODULE64);
        if (!SymGetModuleInfo64(store->sessionHandle(), base, &modInfo)) {
            error = "Could not query " + path + ": " + pedbg_internal::lastErrorMessage();
            return nullptr;
        }
        static_assert(sizeof(modInfo.PdbSig70) == sizeof(info.guid), "GUID size");
        if (std::memcmp(&modInfo.PdbSig70, info.guid, sizeof(info.guid)) != 0 || modInfo.PdbAge != info.age) {
            error = path + " does not match the image (GUID/age differ)";
            return nullptr;
        }
    }

    if (store->log) store->log("(dbghelp) loaded " + path);
    return store;
}

Status DbgHelpSymbolStore::forEachPublicFunction(const std::function<void(const std::string& name, uint32_t rva)>& fn) {
    if (!initialized || !loadBase) return Status::NotAttached;

    SearchContext ctx{loadBase, &fn};
    if (!SymSearch(sessionHandle(), loadBase, 0, SymTagPublicSymbol, NULL, 0,
                   publicSymbolCallback, &ctx, SYMSEARCH_ALLITEMS)) {
        if (log) log("(dbghelp) SymSearch failed for " + path + ": " + pedbg_internal::lastErrorMessage());
        return Status::Error;
    }
    return Status::Ok;
}

} // namespace pedbg
