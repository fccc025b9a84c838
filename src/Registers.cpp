#include "pedbg/arch/X64Registers.h"
#include <iomanip>
#include <ostream>

namespace pedbg {

namespace {

struct NamedRegister {
    const char* name;
    uint64_t value;
};

void printRow(std::ostream& os, const NamedRegister* regs, size_t count, int width) {
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) os << " ";
        os << std::setw(3) << std::setfill(' ') << regs[i].name << "="
           << std::setw(width) << std::setfill('0') << regs[i].value;
    }
    os << "\n";
}

} // namespace

void X64Registers::print(std::ostream& os) const {
    std::ios::fmtflags flags = os.flags();
    char fill = os.fill();
    os << std::hex << std::right;

    const NamedRegister general[] = {
        {"rax", rax}, {"rbx", rbx}, {"rcx", rcx},
        {"rdx", rdx}, {"rsi", rsi}, {"rdi", rdi},
        {"rip", rip}, {"rsp", rsp}, {"rbp", rbp},
        {"r8", r8},   {"r9", r9},   {"r10", r10},
        {"r11", r11}, {"r12", r12}, {"r13", r13},
        {"r14", r14}, {"r15", r15}, {"efl", rflags},
    };
    for (size_t row = 0; row < sizeof(general) / sizeof(general[0]); row += 3) {
        printRow(os, general + row, 3, 16);
    }

    const NamedRegister segments[] = {
        {"cs", cs}, {"ss", ss}, {"ds", ds}, {"es", es}, {"fs", fs}, {"gs", gs},
    };
    printRow(os, segments, 6, 4);

    os.flags(flags);
    os.fill(fill);
}

} // namespace pedbg
