// Breakpoint registry
#pragma once

#include "Types.h"
#include <iosfwd>
#include <string>
#include <vector>

namespace pedbg {

class Process;

class BreakpointManager {
public:
    static constexpr uint32_t kMaxBreakpoints = 1024;

    // Register a breakpoint under the lowest free id. Fails when all ids are taken.
    Status add(Address address, uint32_t& id, std::string& error);

    // Removing an unknown id does nothing
    void remove(uint32_t id);

    // One line per breakpoint, with its symbol when it resolves
    void list(Process& process, std::ostream& os) const;

    const std::vector<Breakpoint>& breakpoints() const { return entries; }

private:
    std::vector<Breakpoint> entries;  // sorted by id
};

} // namespace pedbg
