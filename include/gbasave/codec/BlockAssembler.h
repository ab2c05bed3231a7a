#pragma once
#include <cstdint>
#include <map>
#include <vector>

#include "gbasave/codec/GameProfile.h"
#include "gbasave/codec/SectorStore.h"
#include "gbasave/codec/SlotResolver.h"

namespace GBASave::Codec {

    // logical id -> physical sector index, valid sectors of the active range only
    using SectorMap = std::map<uint16_t, uint32_t>;

    class BlockAssembler {
    public:
        // When two valid sectors claim the same logical id, the later physical index wins.
        static SectorMap BuildSectorMap(const std::vector<Sector>& sectors, const SlotResolution& slot);

        /**
         * Concatenate the payloads of logical ids [firstId, lastId] into one
         * buffer, id-ordered, each at (id - firstId) * payloadSize.
         * Missing ids leave their region zero-filled; a block with no ids
         * present is all zero.
         */
        static std::vector<uint8_t> Assemble(const std::vector<uint8_t>& image, const SectorMap& map,
                                             const GameProfile& profile, uint16_t firstId, uint16_t lastId);

        /**
         * Inverse of Assemble for a subset of ids: copy each chunk back to
         * its physical sector and refresh that sector's checksum. Ids that
         * are not in the map are left alone; returns false if any was skipped.
         */
        static bool Scatter(const std::vector<uint8_t>& block, std::vector<uint8_t>& image, const SectorMap& map,
                            const GameProfile& profile, uint16_t firstId, const std::vector<uint16_t>& ids);
    };

}
