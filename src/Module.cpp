#include "pedbg/Module.h"
#include "pedbg/PeImage.h"
#include <algorithm>
#include <cstring>

namespace pedbg {

namespace {

// Arbitrary limits to keep corrupt headers from sending us off reading forever
constexpr size_t kMaxDebugDirectories = 20;
constexpr size_t kMaxModuleNameLength = 512;
constexpr size_t kMaxExportNameLength = 4096;
constexpr size_t kMaxForwarderLength = 4096;

void readDebugInfo(const pe::NtHeaders64& headers, Address moduleAddress,
                   const MemorySource& memory, const SymbolStoreOpener& openSymbols, Module& module) {
    module.symbolError = "No matching symbol file";

    const pe::DataDirectory& debugTable = headers.optionalHeader.dataDirectory[pe::kDirectoryEntryDebug];
    if (debugTable.virtualAddress == 0) return;

    size_t count = std::min<size_t>(debugTable.size / sizeof(pe::DebugDirectory), kMaxDebugDirectories);
    for (size_t i = 0; i < count; ++i) {
        Address entryAddress = moduleAddress + debugTable.virtualAddress + i * sizeof(pe::DebugDirectory);
        pe::DebugDirectory entry{};
        if (!readMemoryData(memory, entryAddress, entry)) break;
        if (entry.type != pe::kDebugTypeCodeView) continue;
        if (entry.sizeOfData < sizeof(pe::CodeViewPdb70)) continue;

        Address recordAddress = moduleAddress + entry.addressOfRawData;
        pe::CodeViewPdb70 record{};
        if (!readMemoryData(memory, recordAddress, record)) continue;
        if (record.signature != pe::kCodeViewSignatureRsds) continue;

        CodeViewInfo info;
        info.signature = record.signature;
        std::memcpy(info.guid, record.guid, sizeof(info.guid));
        info.age = record.age;
        size_t maxNameLength = entry.sizeOfData - sizeof(pe::CodeViewPdb70);
        info.pdbPath = readMemoryString(memory, recordAddress + sizeof(pe::CodeViewPdb70), maxNameLength, false);

        module.symbols.reset();
        module.symbolError.clear();
        if (openSymbols) {
            std::string error;
            module.symbols = openSymbols(info, module.size, error);
            if (!module.symbols) {
                module.symbolError = error.empty() ? "Could not open " + info.pdbPath : error;
            }
        } else {
            module.symbolError = "No symbol reader available";
        }
        module.codeView = std::move(info);
    }
}

Status readExports(const pe::NtHeaders64& headers, Address moduleAddress, const MemorySource& memory,
                   std::vector<Export>& exports, std::optional<std::string>& exportModuleName, std::string& error) {
    const pe::DataDirectory& exportTable = headers.optionalHeader.dataDirectory[pe::kDirectoryEntryExport];
    if (exportTable.virtualAddress == 0) return Status::Ok;

    Address tableStart = moduleAddress + exportTable.virtualAddress;
    Address tableEnd = tableStart + exportTable.size;

    pe::ExportDirectory directory{};
    if (!readMemoryData(memory, tableStart, directory)) {
        error = "Could not read export directory at " + formatHex(tableStart);
        return Status::Error;
    }

    // Every table entry is at least 4 bytes inside the image
    uint64_t maxEntries = headers.optionalHeader.sizeOfImage / 4;
    if (directory.numberOfFunctions > maxEntries || directory.numberOfNames > maxEntries) {
        error = "Export directory claims " + std::to_string(directory.numberOfFunctions) + " functions and " +
                std::to_string(directory.numberOfNames) + " names, more than the image can hold";
        return Status::Error;
    }

    // Fallback display name when the load event did not provide one
    if (directory.name != 0) {
        exportModuleName = readMemoryString(memory, moduleAddress + directory.name, kMaxModuleNameLength, false);
    }

    // The name table is a pair of parallel arrays: index into the address
    // table, and RVA of the name. A truncated table makes every name suspect.
    std::vector<uint16_t> nameOrdinals;
    if (!readMemoryFullArray(memory, moduleAddress + directory.addressOfNameOrdinals, directory.numberOfNames, nameOrdinals)) {
        error = "Could not read export name ordinal table";
        return Status::Error;
    }
    std::vector<uint32_t> namePointers;
    if (!readMemoryFullArray(memory, moduleAddress + directory.addressOfNames, directory.numberOfNames, namePointers)) {
        error = "Could not read export name table";
        return Status::Error;
    }
    std::vector<uint32_t> addressTable;
    if (!readMemoryFullArray(memory, moduleAddress + directory.addressOfFunctions, directory.numberOfFunctions, addressTable)) {
        error = "Could not read export address table";
        return Status::Error;
    }

    exports.reserve(addressTable.size());
    for (size_t index = 0; index < addressTable.size(); ++index) {
        Export entry;
        entry.ordinal = directory.base + static_cast<uint32_t>(index);

        auto named = std::find(nameOrdinals.begin(), nameOrdinals.end(), static_cast<uint16_t>(index));
        if (named != nameOrdinals.end()) {
            size_t nameIndex = static_cast<size_t>(named - nameOrdinals.begin());
            entry.name = readMemoryString(memory, moduleAddress + namePointers[nameIndex], kMaxExportNameLength, false);
        }

        // A target inside the export directory is a forwarder string, not code
        Address target = moduleAddress + addressTable[index];
        if (target >= tableStart && target < tableEnd) {
            entry.kind = ExportTargetKind::Forwarder;
            entry.forwarder = readMemoryString(memory, target, kMaxForwarderLength, false);
        } else {
            entry.kind = ExportTargetKind::Rva;
            entry.address = target;
        }
        exports.push_back(std::move(entry));
    }

    return Status::Ok;
}

} // namespace

std::string Export::displayName() const {
    if (name) return *name;
    return "Ordinal" + std::to_string(ordinal);
}

std::string defaultModuleName(Address address) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "module_%llX", static_cast<unsigned long long>(address));
    return buf;
}

Status parseModule(Address address,
                   const std::optional<std::string>& nameHint,
                   const MemorySource& memory,
                   const SymbolStoreOpener& openSymbols,
                   Module& out,
                   std::string& error) {
    out.name = nameHint ? *nameHint : defaultModuleName(address);
    out.address = address;
    out.size = 0;
    out.exports.clear();
    out.codeView.reset();
    out.symbols.reset();
    out.symbolError.clear();
    out.loadError.clear();

    pe::DosHeader dosHeader{};
    if (!readMemoryData(memory, address, dosHeader)) {
        error = "Could not read DOS header at " + formatHex(address);
        return Status::Error;
    }
    if (dosHeader.magic != pe::kDosSignature) {
        error = "Bad DOS header signature at " + formatHex(address);
        return Status::Error;
    }

    // TODO: bounds-check e_lfanew and the directory RVAs against SizeOfImage
    Address ntHeadersAddress = address + static_cast<uint32_t>(dosHeader.lfanew);
    pe::NtHeaders64 headers{};
    if (!readMemoryData(memory, ntHeadersAddress, headers)) {
        error = "Could not read NT headers at " + formatHex(ntHeadersAddress);
        return Status::Error;
    }
    if (headers.signature != pe::kNtSignature) {
        error = "Bad NT headers signature at " + formatHex(ntHeadersAddress);
        return Status::Error;
    }
    if (headers.optionalHeader.magic != pe::kOptionalHeader64Magic) {
        error = headers.optionalHeader.magic == pe::kOptionalHeader32Magic
            ? "32-bit images are not supported"
            : "Unknown optional header magic " + formatHex(headers.optionalHeader.magic);
        return Status::NotSupported;
    }

    out.size = headers.optionalHeader.sizeOfImage;

    readDebugInfo(headers, address, memory, openSymbols, out);

    std::optional<std::string> exportModuleName;
    Status status = readExports(headers, address, memory, out.exports, exportModuleName, error);
    if (!nameHint && exportModuleName && !exportModuleName->empty()) {
        out.name = *exportModuleName;
    }
    if (status != Status::Ok) {
        out.exports.clear();
        return status;
    }

    return Status::Ok;
}

} // namespace pedbg
