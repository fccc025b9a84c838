// PE32+ image structures as they are laid out in a loaded image
#pragma once

#include <cstddef>
#include <cstdint>

namespace pedbg {
namespace pe {

constexpr uint16_t kDosSignature = 0x5A4D;          // "MZ"
constexpr uint32_t kNtSignature = 0x00004550;       // "PE\0\0"
constexpr uint16_t kOptionalHeader64Magic = 0x20B;  // PE32+
constexpr uint16_t kOptionalHeader32Magic = 0x10B;

constexpr size_t kNumberOfDirectoryEntries = 16;
constexpr size_t kDirectoryEntryExport = 0;
constexpr size_t kDirectoryEntryDebug = 6;

constexpr uint32_t kDebugTypeCodeView = 2;
constexpr uint32_t kCodeViewSignatureRsds = 0x53445352;  // "RSDS"

#pragma pack(push, 4)

struct DosHeader {
    uint16_t magic;
    uint16_t unused[29];
    int32_t lfanew;          // offset of the NT headers
};

struct FileHeader {
    uint16_t machine;
    uint16_t numberOfSections;
    uint32_t timeDateStamp;
    uint32_t pointerToSymbolTable;
    uint32_t numberOfSymbols;
    uint16_t sizeOfOptionalHeader;
    uint16_t characteristics;
};

struct DataDirectory {
    uint32_t virtualAddress;
    uint32_t size;
};

struct OptionalHeader64 {
    uint16_t magic;
    uint8_t majorLinkerVersion;
    uint8_t minorLinkerVersion;
    uint32_t sizeOfCode;
    uint32_t sizeOfInitializedData;
    uint32_t sizeOfUninitializedData;
    uint32_t addressOfEntryPoint;
    uint32_t baseOfCode;
    uint64_t imageBase;
    uint32_t sectionAlignment;
    uint32_t fileAlignment;
    uint16_t majorOperatingSystemVersion;
    uint16_t minorOperatingSystemVersion;
    uint16_t majorImageVersion;
    uint16_t minorImageVersion;
    uint16_t majorSubsystemVersion;
    uint16_t minorSubsystemVersion;
    uint32_t win32VersionValue;
    uint32_t sizeOfImage;
    uint32_t sizeOfHeaders;
    uint32_t checkSum;
    uint16_t subsystem;
    uint16_t dllCharacteristics;
    uint64_t sizeOfStackReserve;
    uint64_t sizeOfStackCommit;
    uint64_t sizeOfHeapReserve;
    uint64_t sizeOfHeapCommit;
    uint32_t loaderFlags;
    uint32_t numberOfRvaAndSizes;
    DataDirectory dataDirectory[kNumberOfDirectoryEntries];
};

struct NtHeaders64 {
    uint32_t signature;
    FileHeader fileHeader;
    OptionalHeader64 optionalHeader;
};

struct DebugDirectory {
    uint32_t characteristics;
    uint32_t timeDateStamp;
    uint16_t majorVersion;
    uint16_t minorVersion;
    uint32_t type;
    uint32_t sizeOfData;
    uint32_t addressOfRawData;
    uint32_t pointerToRawData;
};

struct ExportDirectory {
    uint32_t characteristics;
    uint32_t timeDateStamp;
    uint16_t majorVersion;
    uint16_t minorVersion;
    uint32_t name;
    uint32_t base;
    uint32_t numberOfFunctions;
    uint32_t numberOfNames;
    uint32_t addressOfFunctions;
    uint32_t addressOfNames;
    uint32_t addressOfNameOrdinals;
};

// CodeView PDB 7.0 record; the null-terminated PDB path follows it
struct CodeViewPdb70 {
    uint32_t signature;
    uint8_t guid[16];
    uint32_t age;
};

#pragma pack(pop)

static_assert(sizeof(DosHeader) == 64, "DOS header layout");
static_assert(sizeof(FileHeader) == 20, "file header layout");
static_assert(sizeof(OptionalHeader64) == 240, "optional header layout");
static_assert(sizeof(NtHeaders64) == 264, "NT headers layout");
static_assert(sizeof(DebugDirectory) == 28, "debug directory layout");
static_assert(sizeof(ExportDirectory) == 40, "export directory layout");
static_assert(sizeof(CodeViewPdb70) == 24, "CodeView record layout");

} // namespace pe
} // namespace pedbg
