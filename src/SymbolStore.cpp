#include "pedbg/SymbolStore.h"
#include "platform/Platform.h"
#include <filesystem>
#include <system_error>

#ifdef _WIN32
#include "symbols/DbgHelpSymbolStore.h"
#endif

namespace pedbg {

SymbolOptions SymbolOptions::fromEnvironment() {
    SymbolOptions options;
    if (auto path = pedbg_internal::getEnvironment("_NT_SYMBOL_PATH")) {
        options.searchPath = *path;
    }
    return options;
}

// Final path component, accepting either separator
static std::string fileNameOf(const std::string& path) {
    size_t lastSlash = path.find_last_of("\\/");
    return lastSlash == std::string::npos ? path : path.substr(lastSlash + 1);
}

static bool isRegularFile(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::optional<std::string> locateSymbolFile(const std::string& pdbPath, const SymbolOptions& options) {
    if (pdbPath.empty()) return std::nullopt;
    if (isRegularFile(pdbPath)) return pdbPath;

    std::string fileName = fileNameOf(pdbPath);
    size_t start = 0;
    while (start <= options.searchPath.size()) {
        size_t end = options.searchPath.find(';', start);
        if (end == std::string::npos) end = options.searchPath.size();
        std::string dir = options.searchPath.substr(start, end - start);
        start = end + 1;

        // symbol server entries (srv*cache*url) need a download, skip them
        if (dir.empty() || dir.find('*') != std::string::npos) continue;

        std::filesystem::path candidate = std::filesystem::path(dir) / fileName;
        if (isRegularFile(candidate)) return candidate.string();
    }
    return std::nullopt;
}

SymbolStoreOpener defaultSymbolStoreOpener(const SymbolOptions& options, std::function<void(const std::string&)> log) {
    return [options, log](const CodeViewInfo& info, uint64_t imageSize, std::string& error) -> std::unique_ptr<SymbolStore> {
        std::optional<std::string> path = locateSymbolFile(info.pdbPath, options);
        if (!path) {
            error = "Symbol file " + info.pdbPath + " not found";
            return nullptr;
        }
#ifdef _WIN32
        return DbgHelpSymbolStore::open(*path, info, imageSize, options, log, error);
#else
        (void)imageSize;
        (void)log;
        error = "Reading " + *path + " is not supported on this platform";
        return nullptr;
#endif
    };
}

} // namespace pedbg
