// POSIX platform helpers implementation
#include "platform/Platform.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace pedbg_internal {
    std::optional<std::string> getEnvironment(const char* name) {
        const char* value = std::getenv(name);
        if (!value) return std::nullopt;
        return std::string(value);
    }

    std::string lastErrorMessage() {
        int code = errno;
        return std::string(std::strerror(code)) + " (errno " + std::to_string(code) + ")";
    }
}
