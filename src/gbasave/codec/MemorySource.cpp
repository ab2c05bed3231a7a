#include "gbasave/codec/MemorySource.h"

#include <cstring>
#include <utility>

namespace GBASave::Codec {

    SnapshotMemorySource::SnapshotMemorySource(uint32_t baseAddress, std::vector<uint8_t> bytes)
        : m_base(baseAddress), m_bytes(std::move(bytes)) {}

    bool SnapshotMemorySource::InRange(uint32_t address, size_t size) const {
        if (address < m_base) return false;
        size_t offset = address - m_base;
        return offset <= m_bytes.size() && size <= m_bytes.size() - offset;
    }

    bool SnapshotMemorySource::ReadBytes(uint32_t address, uint8_t* dst, size_t size) {
        if (!InRange(address, size)) return false;
        if (size > 0) std::memcpy(dst, &m_bytes[address - m_base], size);
        return true;
    }

    bool SnapshotMemorySource::WriteBytes(uint32_t address, const uint8_t* src, size_t size) {
        if (!InRange(address, size)) return false;
        if (size > 0) std::memcpy(&m_bytes[address - m_base], src, size);
        return true;
    }

}
