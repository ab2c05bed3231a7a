#pragma once
#include <cstdint>
#include <vector>

#include "gbasave/codec/GameProfile.h"
#include "gbasave/codec/SectorStore.h"

namespace GBASave::Codec {

    struct SlotResolution {
        SlotRange range = SlotRange::A;
        uint64_t sumA = 0;
        uint64_t sumB = 0;
        uint32_t baseIndex = 0;     // first physical sector of the active range
        uint32_t count = 0;         // sectors in the active range
        bool forced = false;
    };

    class SlotResolver {
    public:
        // Sum of counters of valid sectors with physical index in [first, first + count).
        static uint64_t CounterSum(const std::vector<Sector>& sectors, uint32_t first, uint32_t count);

        // Picks the authoritative range through the profile's tie-break rule,
        // unless the caller forces one.
        static SlotResolution Resolve(const std::vector<Sector>& sectors, const GameProfile& profile,
                                      SlotPreference preference = SlotPreference::Auto);
    };

}
