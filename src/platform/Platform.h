// Platform utility helpers (small OS-specific pieces shared by the core and the backends)
#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace pedbg_internal {
    // value of an environment variable, nullopt when it is not set
    std::optional<std::string> getEnvironment(const char* name);

    // text for the calling thread's last OS error, with the numeric code
    std::string lastErrorMessage();
}
