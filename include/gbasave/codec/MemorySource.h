#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace GBASave::Codec {

    // Byte access to a running game's address space (an emulator bridge,
    // a RAM dump). Addresses are GBA bus addresses.
    class MemorySource {
    public:
        virtual ~MemorySource() = default;

        virtual bool ReadBytes(uint32_t address, uint8_t* dst, size_t size) = 0;
        virtual bool WriteBytes(uint32_t address, const uint8_t* src, size_t size) = 0;
    };

    // A RAM dump mapped at a base address, e.g. EWRAM at 0x02000000.
    class SnapshotMemorySource : public MemorySource {
    public:
        SnapshotMemorySource(uint32_t baseAddress, std::vector<uint8_t> bytes);

        bool ReadBytes(uint32_t address, uint8_t* dst, size_t size) override;
        bool WriteBytes(uint32_t address, const uint8_t* src, size_t size) override;

        uint32_t BaseAddress() const { return m_base; }
        const std::vector<uint8_t>& Bytes() const { return m_bytes; }

    private:
        bool InRange(uint32_t address, size_t size) const;

        uint32_t m_base;
        std::vector<uint8_t> m_bytes;
    };

}
