#pragma once
#include <cstdint>
#include <cstddef>

// Little-endian field access for save buffers. Callers bounds-check.
namespace GBASave::Codec {

    inline uint16_t Read16(const uint8_t* p) {
        return static_cast<uint16_t>(p[0] | (p[1] << 8));
    }

    inline uint32_t Read32(const uint8_t* p) {
        return static_cast<uint32_t>(p[0]) |
               (static_cast<uint32_t>(p[1]) << 8) |
               (static_cast<uint32_t>(p[2]) << 16) |
               (static_cast<uint32_t>(p[3]) << 24);
    }

    inline void Write16(uint8_t* p, uint16_t value) {
        p[0] = value & 0xFF;
        p[1] = (value >> 8) & 0xFF;
    }

    inline void Write32(uint8_t* p, uint32_t value) {
        p[0] = value & 0xFF;
        p[1] = (value >> 8) & 0xFF;
        p[2] = (value >> 16) & 0xFF;
        p[3] = (value >> 24) & 0xFF;
    }

}
