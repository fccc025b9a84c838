#include "pedbg/SymbolResolver.h"
#include "pedbg/Process.h"
#include "pedbg/Module.h"

namespace pedbg {

Status resolveFunctionInModule(const Module& module, const std::string& function, Address& out, std::string& error) {
    for (const auto& entry : module.exports) {
        if (!entry.name || *entry.name != function) continue;

        if (entry.isForwarder()) {
            // TODO: follow the forwarder into the target module
            error = "Export " + function + " in module " + module.name + " is forwarded to " + entry.forwarder
                + ", which is not supported yet";
            return Status::NotSupported;
        }
        out = entry.address;
        return Status::Ok;
    }

    error = "Could not find " + function + " in module " + module.name;
    return Status::NotFound;
}

Status resolveNameToAddress(const std::string& qualifiedName, Process& process, Address& out, std::string& error) {
    size_t bang = qualifiedName.find('!');
    if (bang == std::string::npos) {
        error = "Symbol " + qualifiedName + " must be qualified as module!symbol; searching all modules is not supported";
        return Status::NotSupported;
    }

    std::string moduleName = qualifiedName.substr(0, bang);
    std::string function = qualifiedName.substr(bang + 1);

    Module* module = process.getModuleByName(moduleName);
    if (!module) {
        error = "Could not find module " + moduleName;
        return Status::NotFound;
    }

    Status status = resolveFunctionInModule(*module, function, out, error);
    if (status == Status::NotFound) {
        error = "Could not find " + function + " in module " + moduleName;
    }
    return status;
}

std::optional<std::string> resolveAddressToName(Address address, Process& process) {
    Module* module = process.getContainingModule(address);
    if (!module) return std::nullopt;

    // Linear search for the closest export at or before the address.
    // TODO: keep the exports sorted by address and binary search
    const Export* closestExport = nullptr;
    for (const auto& entry : module->exports) {
        if (entry.isForwarder() || entry.address > address) continue;
        if (!closestExport || closestExport->address < entry.address) {
            closestExport = &entry;
        }
    }

    // Same over the public functions of the symbol file. Later or equal
    // addresses replace the current candidate, including an export.
    bool havePublic = false;
    std::string closestPublic;
    Address closestPublicAddress = 0;
    if (module->symbols) {
        Address floor = closestExport ? closestExport->address : 0;
        Address moduleAddress = module->address;
        Status status = module->symbols->forEachPublicFunction([&](const std::string& name, uint32_t rva) {
            Address globalAddress = moduleAddress + rva;
            if (globalAddress > address) return;
            bool beatsExport = !closestExport || floor <= globalAddress;
            bool beatsPublic = !havePublic || closestPublicAddress <= globalAddress;
            if (beatsExport && beatsPublic) {
                havePublic = true;
                closestPublic = name;
                closestPublicAddress = globalAddress;
            }
        });
        if (status != Status::Ok) {
            havePublic = false;
        }
    }

    std::string symbol;
    Address symbolAddress = 0;
    if (havePublic) {
        symbol = closestPublic;
        symbolAddress = closestPublicAddress;
    } else if (closestExport) {
        symbol = closestExport->displayName();
        symbolAddress = closestExport->address;
    } else {
        return std::nullopt;
    }

    Address offset = address - symbolAddress;
    if (offset == 0) {
        return module->name + "!" + symbol;
    }
    return module->name + "!" + symbol + "+" + formatHex(offset);
}

} // namespace pedbg
