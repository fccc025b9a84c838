// Address <-> name resolution over the modules of a process
#pragma once

#include "Types.h"
#include <optional>
#include <string>

namespace pedbg {

class Process;
struct Module;

// "module!symbol" or "module!symbol+0x<offset>" for the closest symbol at or
// before `address`, taken from the export table and the module's symbol file.
// Symbol file entries win ties with exports.
std::optional<std::string> resolveAddressToName(Address address, Process& process);

// Resolve a "module!function" name. Unqualified names are rejected.
Status resolveNameToAddress(const std::string& qualifiedName, Process& process, Address& out, std::string& error);

// Look up an export of `module` by exact name
Status resolveFunctionInModule(const Module& module, const std::string& function, Address& out, std::string& error);

} // namespace pedbg
