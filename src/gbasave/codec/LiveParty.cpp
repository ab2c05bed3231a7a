#include "gbasave/codec/LiveParty.h"

namespace GBASave::Codec {

    LiveParty::LiveParty(MemorySource& source, const GameProfile& profile)
        : Loggable("LiveParty"), m_source(source),
          m_profile(std::make_shared<const GameProfile>(profile)) {}

    SaveStatus LiveParty::Read(std::vector<CreatureRecord>& out) {
        out.clear();
        const MemoryMap& map = m_profile->memory;
        if (!map.available) {
            LogWarn("%s: no RAM party address known", m_profile->name.c_str());
            return SaveStatus::UnsupportedGame;
        }

        uint8_t count = 0;
        if (!m_source.ReadBytes(map.partyCountAddress, &count, 1)) {
            LogError("party count read failed at 0x%08X", map.partyCountAddress);
            return SaveStatus::SourceReadFailed;
        }
        if (count > m_profile->roster.maxPartySize) {
            LogWarn("party count %u exceeds %u", count, m_profile->roster.maxPartySize);
            return SaveStatus::InvalidPartyCount;
        }

        const uint32_t size = m_profile->record.partySize;
        std::vector<uint8_t> bytes(size);
        for (uint32_t i = 0; i < count; ++i) {
            uint32_t address = map.partyAddress + i * size;
            if (!m_source.ReadBytes(address, bytes.data(), size)) {
                LogError("record %u read failed at 0x%08X", i, address);
                out.clear();
                return SaveStatus::SourceReadFailed;
            }
            std::optional<CreatureRecord> record =
                CreatureRecord::FromBytes(bytes.data(), bytes.size(), m_profile, RecordKind::Party);
            if (!record) return SaveStatus::RecordSizeMismatch;
            if (record->IsEmpty()) {
                LogDebug("party ends at slot %u: empty", i);
                break;
            }
            if (!record->ChecksumValid()) {
                LogWarn("party slot %u: record checksum mismatch, kept", i);
            }
            out.push_back(std::move(*record));
        }

        LogInfo("%s: %zu live party records", m_profile->name.c_str(), out.size());
        return SaveStatus::Ok;
    }

    SaveStatus LiveParty::Write(const std::vector<CreatureRecord>& roster) {
        const MemoryMap& map = m_profile->memory;
        if (!map.available) return SaveStatus::UnsupportedGame;
        if (roster.size() > m_profile->roster.maxPartySize) return SaveStatus::RosterTooLong;

        const uint32_t size = m_profile->record.partySize;
        for (const CreatureRecord& record : roster) {
            if (record.Kind() != RecordKind::Party || record.Bytes().size() != size) {
                return SaveStatus::RecordSizeMismatch;
            }
        }

        std::vector<uint8_t> empty(size, 0);
        for (uint32_t i = 0; i < m_profile->roster.maxPartySize; ++i) {
            const uint8_t* src = i < roster.size() ? roster[i].Bytes().data() : empty.data();
            uint32_t address = map.partyAddress + i * size;
            if (!m_source.WriteBytes(address, src, size)) {
                LogError("record %u write failed at 0x%08X", i, address);
                return SaveStatus::SourceWriteFailed;
            }
        }

        uint8_t count = static_cast<uint8_t>(roster.size());
        if (!m_source.WriteBytes(map.partyCountAddress, &count, 1)) {
            LogError("party count write failed at 0x%08X", map.partyCountAddress);
            return SaveStatus::SourceWriteFailed;
        }
        return SaveStatus::Ok;
    }

}
