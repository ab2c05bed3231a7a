#include "gbasave/codec/SaveDocument.h"
#include "gbasave/codec/ByteOrder.h"
#include "gbasave/codec/ProfileDetector.h"
#include "gbasave/codec/TextCodec.h"
#include "gbasave/common/Logger.h"

#include <cstring>
#include <set>

namespace GBASave::Codec {

    using Common::Logger;
    using Common::LogLevel;

    namespace {
        constexpr const char* kLogCategory = "SaveDocument";
    }

    const char* RosterStopReasonName(RosterStopReason reason) {
        switch (reason) {
            case RosterStopReason::Exhausted: return "exhausted";
            case RosterStopReason::EmptySlot: return "empty-slot";
            case RosterStopReason::NoData: return "no-data";
        }
        return "unknown";
    }

    SaveDocument::SaveDocument() : Loggable(kLogCategory) {}

    SaveStatus SaveDocument::CheckImageSize(const std::vector<uint8_t>& image, const GameProfile& profile) {
        const SectorGeometry& geo = profile.geometry;
        if (image.empty() || image.size() < geo.ImageSize() || image.size() % geo.sectorSize != 0) {
            return SaveStatus::MalformedInput;
        }
        return SaveStatus::Ok;
    }

    SaveStatus SaveDocument::Load(const std::vector<uint8_t>& image, const GameProfile& profile, SaveDocument& out,
                                  const ParseOptions& options) {
        SaveStatus status = CheckImageSize(image, profile);
        if (status != SaveStatus::Ok) {
            out.LogError("%s: %zu-byte image is not %u sectors of %u bytes", profile.name.c_str(), image.size(),
                         profile.geometry.sectorCount, profile.geometry.sectorSize);
            return status;
        }

        SaveDocument doc;
        doc.m_profile = std::make_shared<const GameProfile>(profile);
        doc.m_image = image;
        doc.m_sectors = SectorStore::Validate(image, profile);
        doc.m_slot = SlotResolver::Resolve(doc.m_sectors, profile, options.slot);
        doc.m_map = BlockAssembler::BuildSectorMap(doc.m_sectors, doc.m_slot);

        const TrainerLayout& trainer = profile.trainer;
        if (doc.m_map.find(trainer.logicalId) == doc.m_map.end()) {
            doc.LogWarn("trainer sector (id %u) missing from active slot", trainer.logicalId);
        }
        doc.m_trainerBlock = BlockAssembler::Assemble(image, doc.m_map, profile, trainer.logicalId, trainer.logicalId);

        const RosterLayout& roster = profile.roster;
        doc.m_rosterBlock = BlockAssembler::Assemble(image, doc.m_map, profile, roster.firstLogicalId,
                                                     roster.lastLogicalId);
        doc.ReadRoster();

        out = std::move(doc);
        return SaveStatus::Ok;
    }

    SaveStatus SaveDocument::LoadDetect(const std::vector<uint8_t>& image, const std::vector<GameProfile>& profiles,
                                        SaveDocument& out, const ParseOptions& options) {
        const GameProfile* profile = nullptr;
        SaveStatus status = ProfileDetector::Detect(image, profiles, profile, options);
        if (status != SaveStatus::Ok) return status;
        return Load(image, *profile, out, options);
    }

    void SaveDocument::ReadRoster() {
        const RosterLayout& layout = m_profile->roster;
        const uint32_t size = m_profile->record.partySize;
        m_roster.clear();

        bool anyRosterSector = false;
        for (uint16_t id = layout.firstLogicalId; id <= layout.lastLogicalId; ++id) {
            if (m_map.count(id)) anyRosterSector = true;
        }
        if (!anyRosterSector) {
            m_stop = RosterStopReason::NoData;
            LogWarn("no roster sectors in active slot");
            return;
        }

        m_stop = RosterStopReason::Exhausted;
        for (uint32_t i = 0; i < layout.maxPartySize; ++i) {
            size_t offset = layout.partyOffset + static_cast<size_t>(i) * size;
            if (offset + size > m_rosterBlock.size()) break;

            std::optional<CreatureRecord> record =
                CreatureRecord::FromBytes(&m_rosterBlock[offset], size, m_profile, RecordKind::Party);
            if (!record) break;

            if (record->IsEmpty()) {
                m_stop = RosterStopReason::EmptySlot;
                LogDebug("roster ends at slot %u: empty", i);
                break;
            }
            if (!record->ChecksumValid()) {
                LogWarn("roster slot %u: record checksum mismatch (personality 0x%08X), kept", i,
                        record->Personality());
            }
            m_roster.push_back(std::move(*record));
        }

        LogInfo("%s: %zu roster records (%s), stored count %u", m_profile->name.c_str(), m_roster.size(),
                RosterStopReasonName(m_stop), StoredPartyCount());
    }

    std::string SaveDocument::PlayerName() const {
        if (!m_profile) return std::string();
        const TrainerLayout& layout = m_profile->trainer;
        if (layout.nameOffset + layout.nameLength > m_trainerBlock.size()) return std::string();
        static const GlyphTable western = GlyphTable::Western();
        const GlyphTable& glyphs = m_profile->tables.glyphs ? *m_profile->tables.glyphs : western;
        return DecodeText(&m_trainerBlock[layout.nameOffset], layout.nameLength, glyphs, true);
    }

    PlayTime SaveDocument::GetPlayTime() const {
        PlayTime time;
        if (!m_profile) return time;
        const TrainerLayout& layout = m_profile->trainer;
        if (layout.hoursOffset + 2 > m_trainerBlock.size() || layout.minutesOffset >= m_trainerBlock.size() ||
            layout.secondsOffset >= m_trainerBlock.size()) {
            return time;
        }
        time.hours = Read16(&m_trainerBlock[layout.hoursOffset]);
        time.minutes = m_trainerBlock[layout.minutesOffset];
        time.seconds = m_trainerBlock[layout.secondsOffset];
        return time;
    }

    uint32_t SaveDocument::StoredPartyCount() const {
        if (!m_profile) return 0;
        uint32_t offset = m_profile->roster.countOffset;
        if (offset + 4 > m_rosterBlock.size()) return 0;
        return Read32(&m_rosterBlock[offset]);
    }

    CreatureRecord* SaveDocument::Member(size_t index) {
        return index < m_roster.size() ? &m_roster[index] : nullptr;
    }

    SaveStatus SaveDocument::Reconstruct(std::vector<uint8_t>& out) const {
        if (!m_profile) return SaveStatus::MalformedInput;
        return Patch(m_image, m_map, m_roster, *m_profile, out);
    }

    SaveStatus SaveDocument::Reconstruct(const std::vector<uint8_t>& baseImage,
                                         const std::vector<CreatureRecord>& roster, const GameProfile& profile,
                                         std::vector<uint8_t>& out, const ParseOptions& options) {
        SaveStatus status = CheckImageSize(baseImage, profile);
        if (status != SaveStatus::Ok) {
            Logger::Instance().LogFmt(LogLevel::Error, kLogCategory, "reconstruct: base image rejected (%s)",
                                      StatusName(status));
            return status;
        }
        std::vector<Sector> sectors = SectorStore::Validate(baseImage, profile);
        SlotResolution slot = SlotResolver::Resolve(sectors, profile, options.slot);
        SectorMap map = BlockAssembler::BuildSectorMap(sectors, slot);
        return Patch(baseImage, map, roster, profile, out);
    }

    SaveStatus SaveDocument::Patch(const std::vector<uint8_t>& baseImage, const SectorMap& map,
                                   const std::vector<CreatureRecord>& roster, const GameProfile& profile,
                                   std::vector<uint8_t>& out) {
        Logger& log = Logger::Instance();
        const RosterLayout& layout = profile.roster;
        const uint32_t size = profile.record.partySize;
        const uint32_t payloadSize = profile.geometry.payloadSize;

        if (roster.size() > layout.maxPartySize) {
            log.LogFmt(LogLevel::Error, kLogCategory, "reconstruct: %zu records exceed party size %u",
                       roster.size(), layout.maxPartySize);
            return SaveStatus::RosterTooLong;
        }

        std::vector<uint8_t> block = BlockAssembler::Assemble(baseImage, map, profile, layout.firstLogicalId,
                                                              layout.lastLogicalId);

        std::set<uint16_t> required;
        for (size_t i = 0; i < roster.size(); ++i) {
            const CreatureRecord& record = roster[i];
            if (record.Kind() != RecordKind::Party || record.Bytes().size() != size) {
                log.LogFmt(LogLevel::Error, kLogCategory, "reconstruct: record %zu is %zu bytes, expected %u", i,
                           record.Bytes().size(), size);
                return SaveStatus::RecordSizeMismatch;
            }
            size_t start = layout.partyOffset + i * size;
            size_t end = start + size - 1;
            if (end >= block.size()) {
                log.LogFmt(LogLevel::Error, kLogCategory, "reconstruct: record %zu runs past the roster block", i);
                return SaveStatus::RosterTooLong;
            }
            for (size_t chunk = start / payloadSize; chunk <= end / payloadSize; ++chunk) {
                required.insert(static_cast<uint16_t>(layout.firstLogicalId + chunk));
            }
        }

        for (uint16_t id : required) {
            if (map.find(id) == map.end()) {
                log.LogFmt(LogLevel::Error, kLogCategory, "reconstruct: roster sector id %u not valid in active slot",
                           id);
                return SaveStatus::MissingSector;
            }
        }

        for (size_t i = 0; i < roster.size(); ++i) {
            std::memcpy(&block[layout.partyOffset + i * size], roster[i].Bytes().data(), size);
        }

        std::vector<uint8_t> image = baseImage;
        std::vector<uint16_t> ids(required.begin(), required.end());
        if (!BlockAssembler::Scatter(block, image, map, profile, layout.firstLogicalId, ids)) {
            log.LogFmt(LogLevel::Error, kLogCategory, "reconstruct: write-back incomplete");
            return SaveStatus::MissingSector;
        }

        out = std::move(image);
        return SaveStatus::Ok;
    }

}
