#include "pedbg/Process.h"
#include "pedbg/SymbolResolver.h"
#include "FakeTarget.h"
#include "TestHarness.h"

using namespace pedbg;
using pedbg_test::FakeSymbolStore;

static Export codeExport(const std::string &name, Address address) {
    Export e;
    e.name = name;
    e.kind = ExportTargetKind::Rva;
    e.address = address;
    return e;
}

static Module makeModule(const std::string &name, Address base, std::vector<Export> exports) {
    Module m;
    m.name = name;
    m.address = base;
    m.size = 0x4000;
    m.exports = std::move(exports);
    return m;
}

int test_exports_only() {
    std::cout << "\n=== Address to name, exports only ===" << std::endl;
    Process process;
    process.addModule(makeModule("module", 0, {codeExport("A", 0x1000), codeExport("B", 0x1010)}));

    auto r = resolveAddressToName(0x1005, process);
    TEST_ASSERT(r && *r == "module!A+0x5", "0x1005 should be A+0x5", 2);
    r = resolveAddressToName(0x1000, process);
    TEST_ASSERT(r && *r == "module!A", "Exact hit has no offset", 3);
    r = resolveAddressToName(0x1010, process);
    TEST_ASSERT(r && *r == "module!B", "0x1010 should be B", 4);
    TEST_ASSERT(!resolveAddressToName(0x100, process), "Before every export resolves to nothing", 5);
    TEST_ASSERT(!resolveAddressToName(0x5000, process), "Outside every module resolves to nothing", 6);

    Process same;
    same.addModule(makeModule("dup", 0, {codeExport("First", 0x1000), codeExport("Second", 0x1000)}));
    r = resolveAddressToName(0x1001, same);
    TEST_ASSERT(r && *r == "dup!First+0x1", "Among equal exports the first one is kept", 7);
    TEST_PASS("Export-based resolution");
    return 0;
}

int test_symbol_store_precedence() {
    std::cout << "\n=== Address to name, with public symbols ===" << std::endl;
    Process process;
    Module &m = process.addModule(makeModule("module", 0, {codeExport("A", 0x1000), codeExport("B", 0x1010)}));
    m.symbols = std::make_unique<FakeSymbolStore>("module.pdb", std::vector<std::pair<std::string, uint32_t>>{
        {"C", 0x1008}, {"D", 0x1010}});

    auto r = resolveAddressToName(0x1009, process);
    TEST_ASSERT(r && *r == "module!C+0x1", "Public symbol after the export wins", 10);

    r = resolveAddressToName(0x1004, process);
    TEST_ASSERT(r && *r == "module!A+0x4", "Public symbols past the address are ignored", 11);

    r = resolveAddressToName(0x1012, process);
    TEST_ASSERT(r && *r == "module!D+0x2", "Public symbol at the same address as an export wins", 12);

    Process earlier;
    Module &e = earlier.addModule(makeModule("module", 0, {codeExport("B", 0x1010)}));
    e.symbols = std::make_unique<FakeSymbolStore>("module.pdb", std::vector<std::pair<std::string, uint32_t>>{
        {"C", 0x1008}});
    r = resolveAddressToName(0x1011, earlier);
    TEST_ASSERT(r && *r == "module!B+0x1", "Export after the public symbol wins", 13);
    r = resolveAddressToName(0x1009, earlier);
    TEST_ASSERT(r && *r == "module!C+0x1", "Public symbol alone resolves", 14);
    TEST_PASS("Tie-breaks between exports and public symbols");
    return 0;
}

int test_name_to_address() {
    std::cout << "\n=== Name to address ===" << std::endl;
    Process process;
    process.addModule(makeModule("C:\\Windows\\System32\\KERNEL32.DLL", 0x10000, {codeExport("ExitProcess", 0x10100)}));

    Address address = 0;
    std::string error;
    TEST_ASSERT(resolveNameToAddress("kernel32!ExitProcess", process, address, error) == Status::Ok,
                "Stem of the path should match: " << error, 20);
    TEST_ASSERT(address == 0x10100, "Address from the trimmed match", 21);

    address = 0;
    TEST_ASSERT(resolveNameToAddress("kernel32.dll!ExitProcess", process, address, error) == Status::Ok,
                "Whole file name should match", 22);
    TEST_ASSERT(address == 0x10100, "Same module for both spellings", 23);

    process.addModule(makeModule("kernel32", 0x20000, {codeExport("ExitProcess", 0x20100)}));
    TEST_ASSERT(resolveNameToAddress("kernel32!ExitProcess", process, address, error) == Status::Ok,
                "Exact match should resolve", 24);
    TEST_ASSERT(address == 0x20100, "Exact name outranks an earlier trimmed match", 25);

    error.clear();
    TEST_ASSERT(resolveNameToAddress("ExitProcess", process, address, error) == Status::NotSupported,
                "Unqualified names are rejected", 26);
    TEST_ASSERT(!error.empty(), "Rejection explains itself", 27);

    TEST_ASSERT(resolveNameToAddress("nosuch!Foo", process, address, error) == Status::NotFound, "Unknown module", 28);
    TEST_ASSERT(error.find("nosuch") != std::string::npos, "Error names the module", 29);

    TEST_ASSERT(resolveNameToAddress("kernel32!Missing", process, address, error) == Status::NotFound, "Unknown function", 30);
    TEST_ASSERT(error.find("Missing") != std::string::npos, "Error names the function", 31);
    TEST_PASS("Qualified name lookup");
    return 0;
}

int test_forwarded_export() {
    std::cout << "\n=== Forwarded export ===" << std::endl;
    Export forwarded;
    forwarded.name = std::string("HeapAlloc");
    forwarded.kind = ExportTargetKind::Forwarder;
    forwarded.forwarder = "NTDLL.RtlAllocateHeap";

    Process process;
    process.addModule(makeModule("kernel32.dll", 0x10000, {forwarded}));

    Address address = 0;
    std::string error;
    TEST_ASSERT(resolveNameToAddress("kernel32!HeapAlloc", process, address, error) == Status::NotSupported,
                "Forwarders are not followed", 40);
    TEST_ASSERT(error.find("NTDLL.RtlAllocateHeap") != std::string::npos, "Error names the forwarder target", 41);
    TEST_ASSERT(!resolveAddressToName(0x10000, process), "Forwarders never resolve addresses", 42);
    TEST_PASS("Forwarded export");
    return 0;
}

int main() {
    RUN_TEST(test_exports_only);
    RUN_TEST(test_symbol_store_precedence);
    RUN_TEST(test_name_to_address);
    RUN_TEST(test_forwarded_export);
    std::cout << "\nAll resolver tests passed" << std::endl;
    return 0;
}
