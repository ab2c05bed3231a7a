#include "gbasave/codec/SectorStore.h"
#include "gbasave/codec/ByteOrder.h"
#include "gbasave/common/Logger.h"

namespace GBASave::Codec {

    using Common::Logger;
    using Common::LogLevel;

    namespace {
        constexpr const char* kLogCategory = "SectorStore";

        // Footer field offsets relative to the footer start.
        constexpr uint32_t kFooterId = 0;
        constexpr uint32_t kFooterChecksum = 2;
        constexpr uint32_t kFooterSignature = 4;
        constexpr uint32_t kFooterCounter = 8;
    }

    const char* SectorFaultName(SectorFault fault) {
        switch (fault) {
            case SectorFault::None: return "ok";
            case SectorFault::Absent: return "absent";
            case SectorFault::BadSignature: return "bad-signature";
            case SectorFault::ChecksumMismatch: return "checksum-mismatch";
        }
        return "unknown";
    }

    uint16_t SectorStore::ComputeChecksum(const uint8_t* payload, size_t size) {
        uint32_t sum = 0;
        for (size_t i = 0; i + 4 <= size; i += 4) {
            sum += Read32(payload + i);
        }
        return static_cast<uint16_t>(((sum >> 16) + (sum & 0xFFFF)) & 0xFFFF);
    }

    Sector SectorStore::ReadSector(const std::vector<uint8_t>& image, uint32_t index, const GameProfile& profile) {
        const SectorGeometry& geo = profile.geometry;
        Sector sector;
        sector.index = index;

        size_t base = static_cast<size_t>(index) * geo.sectorSize;
        size_t footer = base + geo.FooterOffset();
        if (footer + geo.footerSize > image.size() || base + geo.payloadSize > image.size()) {
            return sector;
        }

        const uint8_t* f = &image[footer];
        sector.present = true;
        sector.logicalId = Read16(f + kFooterId);
        sector.storedChecksum = Read16(f + kFooterChecksum);
        sector.signature = Read32(f + kFooterSignature);
        sector.counter = Read32(f + kFooterCounter);
        sector.computedChecksum = ComputeChecksum(&image[base], geo.payloadSize);

        if (sector.signature != geo.signature) {
            sector.fault = SectorFault::BadSignature;
        } else if (sector.computedChecksum != sector.storedChecksum) {
            sector.fault = SectorFault::ChecksumMismatch;
        } else {
            sector.fault = SectorFault::None;
            sector.valid = true;
        }
        return sector;
    }

    std::vector<Sector> SectorStore::Validate(const std::vector<uint8_t>& image, const GameProfile& profile) {
        std::vector<Sector> sectors;
        sectors.reserve(profile.geometry.sectorCount);

        Logger& log = Logger::Instance();
        for (uint32_t i = 0; i < profile.geometry.sectorCount; ++i) {
            Sector sector = ReadSector(image, i, profile);
            if (sector.fault == SectorFault::BadSignature) {
                log.LogFmt(LogLevel::Debug, kLogCategory, "sector %u: signature 0x%08X, skipped",
                           sector.index, sector.signature);
            } else if (sector.fault == SectorFault::ChecksumMismatch) {
                log.LogFmt(LogLevel::Warning, kLogCategory,
                           "sector %u (id %u): checksum 0x%04X stored, 0x%04X computed",
                           sector.index, sector.logicalId, sector.storedChecksum, sector.computedChecksum);
            } else if (sector.fault == SectorFault::Absent) {
                log.LogFmt(LogLevel::Debug, kLogCategory, "sector %u: beyond end of image", sector.index);
            }
            sectors.push_back(sector);
        }
        return sectors;
    }

    bool SectorStore::HasSignature(const std::vector<uint8_t>& image, const GameProfile& profile) {
        for (uint32_t i = 0; i < profile.geometry.sectorCount; ++i) {
            Sector sector = ReadSector(image, i, profile);
            if (sector.present && sector.signature == profile.geometry.signature) return true;
        }
        return false;
    }

    void SectorStore::WriteChecksum(std::vector<uint8_t>& image, uint32_t index, const GameProfile& profile) {
        const SectorGeometry& geo = profile.geometry;
        size_t base = static_cast<size_t>(index) * geo.sectorSize;
        if (base + geo.sectorSize > image.size()) return;
        uint16_t checksum = ComputeChecksum(&image[base], geo.payloadSize);
        Write16(&image[base + geo.FooterOffset() + kFooterChecksum], checksum);
    }

}
