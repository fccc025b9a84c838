#include "pedbg/MemorySource.h"
#include <algorithm>

namespace pedbg {

BufferMemorySource::BufferMemorySource(Address b, std::vector<uint8_t> data)
    : base(b), bytes(std::move(data)) {
}

std::vector<uint8_t> BufferMemorySource::readRawMemory(Address address, size_t size) const {
    if (address < base || address - base >= bytes.size()) {
        return {};
    }
    size_t offset = static_cast<size_t>(address - base);
    size_t available = std::min(size, bytes.size() - offset);
    return std::vector<uint8_t>(bytes.begin() + offset, bytes.begin() + offset + available);
}

static void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string utf16ToUtf8(const std::vector<uint16_t>& units) {
    constexpr uint32_t kReplacement = 0xFFFD;
    std::string out;
    out.reserve(units.size());
    for (size_t i = 0; i < units.size(); ++i) {
        uint32_t unit = units[i];
        if (unit >= 0xD800 && unit <= 0xDBFF) {
            if (i + 1 < units.size() && units[i + 1] >= 0xDC00 && units[i + 1] <= 0xDFFF) {
                uint32_t low = units[++i];
                appendUtf8(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
            } else {
                appendUtf8(out, kReplacement);
            }
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            appendUtf8(out, kReplacement);
        } else {
            appendUtf8(out, unit);
        }
    }
    return out;
}

std::string readMemoryString(const MemorySource& source, Address address, size_t maxCount, bool isWide) {
    if (isWide) {
        std::vector<uint16_t> units = readMemoryArray<uint16_t>(source, address, maxCount);
        auto nul = std::find(units.begin(), units.end(), uint16_t{0});
        units.erase(nul, units.end());
        return utf16ToUtf8(units);
    }

    std::vector<uint8_t> bytes = source.readRawMemory(address, maxCount);
    auto nul = std::find(bytes.begin(), bytes.end(), uint8_t{0});
    return std::string(bytes.begin(), nul);
}

std::string readMemoryStringIndirect(const MemorySource& source, Address address, size_t maxCount, bool isWide) {
    uint64_t stringAddress = 0;
    if (!readMemoryData(source, address, stringAddress) || stringAddress == 0) {
        return {};
    }
    return readMemoryString(source, stringAddress, maxCount, isWide);
}

} // namespace pedbg
