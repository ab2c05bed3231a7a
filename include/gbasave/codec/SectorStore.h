#pragma once
#include <cstdint>
#include <vector>

#include "gbasave/codec/GameProfile.h"

namespace GBASave::Codec {

    enum class SectorFault {
        None,
        Absent,             // footer lies outside the buffer
        BadSignature,
        ChecksumMismatch
    };

    const char* SectorFaultName(SectorFault fault);

    struct Sector {
        uint32_t index = 0;             // physical position in the image
        uint16_t logicalId = 0;
        uint16_t storedChecksum = 0;
        uint16_t computedChecksum = 0;
        uint32_t signature = 0;
        uint32_t counter = 0;
        bool present = false;
        bool valid = false;
        SectorFault fault = SectorFault::Absent;
    };

    // Footer parsing and integrity checks for the flash sectors of one image.
    class SectorStore {
    public:
        // Folded 16-bit sum of the little-endian u32 words of a payload.
        static uint16_t ComputeChecksum(const uint8_t* payload, size_t size);

        static Sector ReadSector(const std::vector<uint8_t>& image, uint32_t index, const GameProfile& profile);

        // One entry per sector of the profile's geometry, invalid ones included.
        static std::vector<Sector> Validate(const std::vector<uint8_t>& image, const GameProfile& profile);

        // True when any sector footer carries the profile's signature.
        static bool HasSignature(const std::vector<uint8_t>& image, const GameProfile& profile);

        // Recomputes and stores the checksum of one physical sector.
        static void WriteChecksum(std::vector<uint8_t>& image, uint32_t index, const GameProfile& profile);
    };

}
