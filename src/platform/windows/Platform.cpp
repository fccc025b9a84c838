// Windows platform helpers implementation
#include "platform/Platform.h"
#include <windows.h>
#include <vector>

namespace pedbg_internal {
    std::optional<std::string> getEnvironment(const char* name) {
        DWORD needed = ::GetEnvironmentVariableA(name, nullptr, 0);
        if (needed == 0) return std::nullopt;

        std::vector<char> buffer(needed);
        DWORD written = ::GetEnvironmentVariableA(name, buffer.data(), needed);
        if (written == 0 || written >= needed) return std::nullopt;
        return std::string(buffer.data(), written);
    }

    std::string lastErrorMessage() {
        DWORD code = ::GetLastError();
        char* text = nullptr;
        DWORD length = ::FormatMessageA(
            FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
            nullptr, code, 0, reinterpret_cast<LPSTR>(&text), 0, nullptr);

        std::string message;
        if (length && text) {
            message.assign(text, length);
            while (!message.empty() && (message.back() == '\n' || message.back() == '\r' || message.back() == ' ')) {
                message.pop_back();
            }
        }
        if (text) ::LocalFree(text);

        if (message.empty()) return "error " + std::to_string(code);
        return message + " (error " + std::to_string(code) + ")";
    }
}
