// Owning wrapper for a Win32 HANDLE
#pragma once

#include <windows.h>

namespace pedbg_internal {

class ScopedHandle {
public:
    ScopedHandle() = default;
    explicit ScopedHandle(HANDLE h) : handle(h) {}
    ~ScopedHandle() { reset(); }

    ScopedHandle(const ScopedHandle&) = delete;
    ScopedHandle& operator=(const ScopedHandle&) = delete;

    ScopedHandle(ScopedHandle&& other) noexcept : handle(other.release()) {}
    ScopedHandle& operator=(ScopedHandle&& other) noexcept {
        if (this != &other) reset(other.release());
        return *this;
    }

    HANDLE get() const { return handle; }

    // NULL and INVALID_HANDLE_VALUE both mean "no handle"
    bool valid() const { return handle != NULL && handle != INVALID_HANDLE_VALUE; }
    explicit operator bool() const { return valid(); }

    HANDLE release() {
        HANDLE h = handle;
        handle = NULL;
        return h;
    }

    void reset(HANDLE h = NULL) {
        if (valid()) ::CloseHandle(handle);
        handle = h;
    }

private:
    HANDLE handle{NULL};
};

} // namespace pedbg_internal
