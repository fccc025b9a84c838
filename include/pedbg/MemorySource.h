// Memory source - reads bytes out of a target (live process, dump, test buffer)
#pragma once

#include "Types.h"
#include <cstring>
#include <string>
#include <type_traits>
#include <vector>

namespace pedbg {

class MemorySource {
public:
    virtual ~MemorySource() = default;

    // Read up to `size` bytes starting at `address`. Stops at the first
    // unreadable byte, so the result may be shorter than requested (or empty).
    virtual std::vector<uint8_t> readRawMemory(Address address, size_t size) const = 0;
};

// A byte buffer mapped at a fixed base address
class BufferMemorySource : public MemorySource {
public:
    BufferMemorySource(Address base, std::vector<uint8_t> bytes);

    std::vector<uint8_t> readRawMemory(Address address, size_t size) const override;

    Address getBase() const { return base; }
    size_t getSize() const { return bytes.size(); }

private:
    Address base;
    std::vector<uint8_t> bytes;
};

// Reads up to `maxCount` items; a trailing partial item is dropped
template<typename T>
std::vector<T> readMemoryArray(const MemorySource& source, Address address, size_t maxCount) {
    static_assert(std::is_trivially_copyable<T>::value, "memory items must be trivially copyable");
    std::vector<uint8_t> raw = source.readRawMemory(address, maxCount * sizeof(T));
    std::vector<T> items(raw.size() / sizeof(T));
    if (!items.empty()) {
        std::memcpy(items.data(), raw.data(), items.size() * sizeof(T));
    }
    return items;
}

// Reads exactly `count` items. Returns false on a short read.
template<typename T>
bool readMemoryFullArray(const MemorySource& source, Address address, size_t count, std::vector<T>& out) {
    out = readMemoryArray<T>(source, address, count);
    return out.size() == count;
}

template<typename T>
bool readMemoryData(const MemorySource& source, Address address, T& out) {
    std::vector<T> items = readMemoryArray<T>(source, address, 1);
    if (items.empty()) return false;
    out = items[0];
    return true;
}

// Read a null-terminated string of at most `maxCount` characters.
// Wide strings are UTF-16 and are converted to UTF-8.
std::string readMemoryString(const MemorySource& source, Address address, size_t maxCount, bool isWide);

// Read a string whose address is stored at `address`
std::string readMemoryStringIndirect(const MemorySource& source, Address address, size_t maxCount, bool isWide);

// UTF-16 to UTF-8, unpaired surrogates become U+FFFD
std::string utf16ToUtf8(const std::vector<uint16_t>& units);

} // namespace pedbg
