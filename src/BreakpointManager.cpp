#include "pedbg/BreakpointManager.h"
#include "pedbg/SymbolResolver.h"
#include <algorithm>
#include <cstdio>
#include <ostream>

namespace pedbg {

Status BreakpointManager::add(Address address, uint32_t& id, std::string& error) {
    // Entries are sorted by id, so the first gap is the lowest free id
    uint32_t candidate = 0;
    while (candidate < entries.size() && entries[candidate].id == candidate) {
        ++candidate;
    }
    if (candidate >= kMaxBreakpoints) {
        error = "All " + std::to_string(kMaxBreakpoints) + " breakpoint ids are in use";
        return Status::Error;
    }

    Breakpoint bp;
    bp.id = candidate;
    bp.address = address;
    entries.push_back(bp);
    std::sort(entries.begin(), entries.end(),
              [](const Breakpoint& a, const Breakpoint& b) { return a.id < b.id; });
    id = candidate;
    return Status::Ok;
}

void BreakpointManager::remove(uint32_t id) {
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [id](const Breakpoint& bp) { return bp.id == id; }),
                  entries.end());
}

void BreakpointManager::list(Process& process, std::ostream& os) const {
    for (const auto& bp : entries) {
        char idText[16];
        std::snprintf(idText, sizeof(idText), "%3u", bp.id);
        os << idText << " " << formatAddress(bp.address);
        if (auto symbol = resolveAddressToName(bp.address, process)) {
            os << " (" << *symbol << ")";
        }
        os << "\n";
    }
}

} // namespace pedbg
