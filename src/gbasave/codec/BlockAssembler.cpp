#include "gbasave/codec/BlockAssembler.h"
#include "gbasave/common/Logger.h"

#include <cstring>

namespace GBASave::Codec {

    using Common::Logger;
    using Common::LogLevel;

    namespace {
        constexpr const char* kLogCategory = "BlockAssembler";
    }

    SectorMap BlockAssembler::BuildSectorMap(const std::vector<Sector>& sectors, const SlotResolution& slot) {
        SectorMap map;
        for (const Sector& sector : sectors) {
            if (!sector.valid) continue;
            if (sector.index < slot.baseIndex || sector.index >= slot.baseIndex + slot.count) continue;
            map[sector.logicalId] = sector.index;
        }
        return map;
    }

    std::vector<uint8_t> BlockAssembler::Assemble(const std::vector<uint8_t>& image, const SectorMap& map,
                                                  const GameProfile& profile, uint16_t firstId, uint16_t lastId) {
        const SectorGeometry& geo = profile.geometry;
        size_t chunks = lastId >= firstId ? static_cast<size_t>(lastId - firstId) + 1 : 0;
        std::vector<uint8_t> block(chunks * geo.payloadSize, 0);

        for (uint16_t id = firstId; id <= lastId && chunks > 0; ++id) {
            auto it = map.find(id);
            if (it == map.end()) {
                Logger::Instance().LogFmt(LogLevel::Warning, kLogCategory,
                                          "logical id %u not present, region left zero", id);
                continue;
            }
            size_t src = static_cast<size_t>(it->second) * geo.sectorSize;
            if (src + geo.payloadSize > image.size()) continue;
            std::memcpy(&block[static_cast<size_t>(id - firstId) * geo.payloadSize], &image[src], geo.payloadSize);
        }
        return block;
    }

    bool BlockAssembler::Scatter(const std::vector<uint8_t>& block, std::vector<uint8_t>& image, const SectorMap& map,
                                 const GameProfile& profile, uint16_t firstId, const std::vector<uint16_t>& ids) {
        const SectorGeometry& geo = profile.geometry;
        bool complete = true;

        for (uint16_t id : ids) {
            auto it = map.find(id);
            size_t chunk = static_cast<size_t>(id - firstId) * geo.payloadSize;
            if (it == map.end() || id < firstId || chunk + geo.payloadSize > block.size()) {
                complete = false;
                continue;
            }
            size_t dst = static_cast<size_t>(it->second) * geo.sectorSize;
            if (dst + geo.sectorSize > image.size()) {
                complete = false;
                continue;
            }
            std::memcpy(&image[dst], &block[chunk], geo.payloadSize);
            SectorStore::WriteChecksum(image, it->second, profile);
        }
        return complete;
    }

}
