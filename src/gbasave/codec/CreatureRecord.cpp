#include "gbasave/codec/CreatureRecord.h"
#include "gbasave/codec/ByteOrder.h"
#include "gbasave/codec/TextCodec.h"
#include "gbasave/common/Logger.h"

#include <algorithm>
#include <utility>

namespace GBASave::Codec {

    using Common::Logger;
    using Common::LogLevel;

    namespace {
        constexpr const char* kLogCategory = "RecordCodec";
        constexpr int kNoField = PayloadLayout::kNoField;

        constexpr uint32_t kIvMask = 0x1F;
        constexpr uint32_t kEggBit = 1u << 30;
        constexpr uint32_t kAbilityBit = 1u << 31;

        bool Has(const std::vector<uint8_t>& plain, int offset, size_t width) {
            return offset != kNoField && static_cast<size_t>(offset) + width <= plain.size();
        }

        uint8_t Plain8(const std::vector<uint8_t>& plain, int offset) {
            return Has(plain, offset, 1) ? plain[offset] : 0;
        }

        uint16_t Plain16(const std::vector<uint8_t>& plain, int offset) {
            return Has(plain, offset, 2) ? Read16(&plain[offset]) : 0;
        }

        uint32_t Plain32(const std::vector<uint8_t>& plain, int offset) {
            return Has(plain, offset, 4) ? Read32(&plain[offset]) : 0;
        }

        int Shifted(int offset, int delta) {
            return offset == kNoField ? kNoField : offset + delta;
        }

        bool ValidStat(Stat stat) {
            int index = static_cast<int>(stat);
            return index >= 0 && index < kStatCount;
        }

        uint16_t ToExternal(const std::shared_ptr<const IdRemap>& remap, uint16_t raw) {
            return remap ? remap->ToExternal(raw) : raw;
        }

        const GlyphTable& DefaultGlyphs() {
            static const GlyphTable table = GlyphTable::Western();
            return table;
        }
    }

    CreatureRecord::CreatureRecord(std::shared_ptr<const GameProfile> profile, RecordKind kind,
                                   std::vector<uint8_t> bytes)
        : m_profile(std::move(profile)), m_kind(kind), m_bytes(std::move(bytes)) {}

    std::optional<CreatureRecord> CreatureRecord::FromBytes(const uint8_t* data, size_t size,
                                                            std::shared_ptr<const GameProfile> profile,
                                                            RecordKind kind) {
        if (!profile) return std::nullopt;
        uint32_t expected = profile->RecordSize(kind);
        if (data == nullptr || expected == 0 || size != expected) {
            Logger::Instance().LogFmt(LogLevel::Debug, kLogCategory, "%s: %zu-byte record rejected (expected %u)",
                                      profile->name.c_str(), size, expected);
            return std::nullopt;
        }
        return CreatureRecord(std::move(profile), kind, std::vector<uint8_t>(data, data + size));
    }

    std::optional<CreatureRecord> CreatureRecord::FromBytes(const uint8_t* data, size_t size,
                                                            const GameProfile& profile, RecordKind kind) {
        return FromBytes(data, size, std::make_shared<const GameProfile>(profile), kind);
    }

    std::optional<CreatureRecord> CreatureRecord::FromBytes(const std::vector<uint8_t>& bytes,
                                                            const GameProfile& profile, RecordKind kind) {
        return FromBytes(bytes.data(), bytes.size(), profile, kind);
    }

    std::vector<uint8_t> CreatureRecord::Plain() const {
        return m_profile->cipher.unpack(*m_profile, m_bytes);
    }

    void CreatureRecord::Commit(const std::vector<uint8_t>& plain) {
        m_profile->cipher.pack(*m_profile, plain, m_bytes);
    }

    const GlyphTable& CreatureRecord::Glyphs() const {
        return m_profile->tables.glyphs ? *m_profile->tables.glyphs : DefaultGlyphs();
    }

    int CreatureRecord::LiveStatOffset(Stat stat) const {
        const RecordLayout& rec = m_profile->record;
        switch (stat) {
            case Stat::Hp: return static_cast<int>(rec.maxHp);
            case Stat::Attack: return static_cast<int>(rec.attack);
            case Stat::Defense: return static_cast<int>(rec.defense);
            case Stat::Speed: return static_cast<int>(rec.speed);
            case Stat::SpAttack: return static_cast<int>(rec.spAttack);
            case Stat::SpDefense: return static_cast<int>(rec.spDefense);
        }
        return kNoField;
    }

    // ------------------------------------------------------------------
    // Header

    bool CreatureRecord::IsEmpty() const {
        return RawSpeciesId() == 0;
    }

    bool CreatureRecord::ChecksumValid() const {
        return m_profile->cipher.verify(*m_profile, m_bytes);
    }

    uint32_t CreatureRecord::Personality() const {
        return Read32(&m_bytes[m_profile->record.personality]);
    }

    uint32_t CreatureRecord::OtId() const {
        return Read32(&m_bytes[m_profile->record.otId]);
    }

    uint16_t CreatureRecord::DisplayOtId() const {
        return static_cast<uint16_t>(OtId() & 0xFFFF);
    }

    std::string CreatureRecord::Nickname() const {
        const RecordLayout& rec = m_profile->record;
        return DecodeText(&m_bytes[rec.nickname], rec.nicknameLength, Glyphs());
    }

    std::string CreatureRecord::OtName() const {
        const RecordLayout& rec = m_profile->record;
        return DecodeText(&m_bytes[rec.otName], rec.otNameLength, Glyphs());
    }

    uint8_t CreatureRecord::Language() const {
        return m_bytes[m_profile->record.language];
    }

    // ------------------------------------------------------------------
    // Payload

    uint16_t CreatureRecord::RawSpeciesId() const {
        return Plain16(Plain(), m_profile->payload.species);
    }

    uint16_t CreatureRecord::SpeciesId() const {
        return ToExternal(m_profile->tables.species, RawSpeciesId());
    }

    std::string CreatureRecord::SpeciesName() const {
        if (!m_profile->tables.species) return std::string();
        const IdEntry* entry = m_profile->tables.species->Find(RawSpeciesId());
        return entry ? entry->name : std::string();
    }

    uint16_t CreatureRecord::RawItemId() const {
        return Plain16(Plain(), m_profile->payload.item);
    }

    uint16_t CreatureRecord::ItemId() const {
        return ToExternal(m_profile->tables.items, RawItemId());
    }

    uint32_t CreatureRecord::Experience() const {
        return Plain32(Plain(), m_profile->payload.experience);
    }

    uint8_t CreatureRecord::PpBonuses() const {
        return Plain8(Plain(), m_profile->payload.ppBonuses);
    }

    uint8_t CreatureRecord::Friendship() const {
        return Plain8(Plain(), m_profile->payload.friendship);
    }

    uint16_t CreatureRecord::RawMove(int slot) const {
        if (slot < 0 || slot >= 4) return 0;
        return Plain16(Plain(), Shifted(m_profile->payload.moves, slot * 2));
    }

    uint16_t CreatureRecord::Move(int slot) const {
        return ToExternal(m_profile->tables.moves, RawMove(slot));
    }

    uint8_t CreatureRecord::Pp(int slot) const {
        if (slot < 0 || slot >= 4) return 0;
        return Plain8(Plain(), Shifted(m_profile->payload.pp, slot));
    }

    uint8_t CreatureRecord::EV(Stat stat) const {
        if (!ValidStat(stat)) return 0;
        return Plain8(Plain(), Shifted(m_profile->payload.evs, static_cast<int>(stat)));
    }

    std::array<uint8_t, kStatCount> CreatureRecord::EVs() const {
        std::vector<uint8_t> plain = Plain();
        std::array<uint8_t, kStatCount> evs{};
        for (int i = 0; i < kStatCount; ++i) {
            evs[i] = Plain8(plain, Shifted(m_profile->payload.evs, i));
        }
        return evs;
    }

    int CreatureRecord::EVTotal() const {
        int total = 0;
        for (uint8_t ev : EVs()) total += ev;
        return total;
    }

    uint8_t CreatureRecord::Contest(int index) const {
        if (index < 0 || index >= 6) return 0;
        return Plain8(Plain(), Shifted(m_profile->payload.contest, index));
    }

    uint8_t CreatureRecord::Pokerus() const {
        return Plain8(Plain(), m_profile->payload.pokerus);
    }

    uint8_t CreatureRecord::MetLocation() const {
        return Plain8(Plain(), m_profile->payload.metLocation);
    }

    // origins: bits 0-6 met level, 7-10 game, 11-14 ball, 15 OT gender
    uint8_t CreatureRecord::MetLevel() const {
        return Plain16(Plain(), m_profile->payload.origins) & 0x7F;
    }

    uint8_t CreatureRecord::MetGame() const {
        return (Plain16(Plain(), m_profile->payload.origins) >> 7) & 0x0F;
    }

    uint8_t CreatureRecord::Pokeball() const {
        return (Plain16(Plain(), m_profile->payload.origins) >> 11) & 0x0F;
    }

    uint8_t CreatureRecord::OtGender() const {
        return (Plain16(Plain(), m_profile->payload.origins) >> 15) & 0x01;
    }

    uint8_t CreatureRecord::IV(Stat stat) const {
        if (!ValidStat(stat)) return 0;
        uint32_t word = Plain32(Plain(), m_profile->payload.ivWord);
        return (word >> (static_cast<int>(stat) * 5)) & kIvMask;
    }

    std::array<uint8_t, kStatCount> CreatureRecord::IVs() const {
        uint32_t word = Plain32(Plain(), m_profile->payload.ivWord);
        std::array<uint8_t, kStatCount> ivs{};
        for (int i = 0; i < kStatCount; ++i) {
            ivs[i] = (word >> (i * 5)) & kIvMask;
        }
        return ivs;
    }

    int CreatureRecord::IVTotal() const {
        int total = 0;
        for (uint8_t iv : IVs()) total += iv;
        return total;
    }

    bool CreatureRecord::IsEgg() const {
        if (!m_profile->payload.ivWordHasFlags) return false;
        return (Plain32(Plain(), m_profile->payload.ivWord) & kEggBit) != 0;
    }

    uint8_t CreatureRecord::AbilityBit() const {
        if (!m_profile->payload.ivWordHasFlags) return 0;
        return (Plain32(Plain(), m_profile->payload.ivWord) & kAbilityBit) ? 1 : 0;
    }

    uint32_t CreatureRecord::Ribbons() const {
        return Plain32(Plain(), m_profile->payload.ribbons);
    }

    // ------------------------------------------------------------------
    // Derived

    Nature CreatureRecord::GetNature() const {
        return m_profile->nature(Personality());
    }

    NatureEffect CreatureRecord::GetNatureEffect() const {
        return Codec::GetNatureEffect(GetNature());
    }

    uint32_t CreatureRecord::ShinyValue() const {
        return m_profile->shinyValue(Personality(), OtId());
    }

    ShinyClass CreatureRecord::GetShinyClass() const {
        return m_profile->shinyClass(Personality(), OtId());
    }

    // ------------------------------------------------------------------
    // Live stats

    uint8_t CreatureRecord::Status() const {
        if (m_kind != RecordKind::Party) return 0;
        return m_bytes[m_profile->record.status];
    }

    uint8_t CreatureRecord::Level() const {
        if (m_kind != RecordKind::Party) return 0;
        return m_bytes[m_profile->record.level];
    }

    uint16_t CreatureRecord::CurrentHp() const {
        if (m_kind != RecordKind::Party) return 0;
        return Read16(&m_bytes[m_profile->record.currentHp]);
    }

    uint16_t CreatureRecord::StatValue(Stat stat) const {
        if (m_kind != RecordKind::Party || !ValidStat(stat)) return 0;
        return Read16(&m_bytes[LiveStatOffset(stat)]);
    }

    CreatureData CreatureRecord::Decode() const {
        const PayloadLayout& pay = m_profile->payload;
        std::vector<uint8_t> plain = Plain();

        CreatureData data;
        data.personality = Personality();
        data.otId = OtId();
        data.nickname = Nickname();
        data.otName = OtName();
        data.language = Language();

        data.rawSpeciesId = Plain16(plain, pay.species);
        data.speciesId = ToExternal(m_profile->tables.species, data.rawSpeciesId);
        data.speciesName = SpeciesName();
        data.rawItemId = Plain16(plain, pay.item);
        data.itemId = ToExternal(m_profile->tables.items, data.rawItemId);
        data.experience = Plain32(plain, pay.experience);
        data.ppBonuses = Plain8(plain, pay.ppBonuses);
        data.friendship = Plain8(plain, pay.friendship);

        for (int i = 0; i < 4; ++i) {
            data.rawMoves[i] = Plain16(plain, Shifted(pay.moves, i * 2));
            data.moves[i] = ToExternal(m_profile->tables.moves, data.rawMoves[i]);
            data.pp[i] = Plain8(plain, Shifted(pay.pp, i));
        }
        for (int i = 0; i < kStatCount; ++i) {
            data.evs[i] = Plain8(plain, Shifted(pay.evs, i));
        }
        for (int i = 0; i < 6; ++i) {
            data.contest[i] = Plain8(plain, Shifted(pay.contest, i));
        }

        data.pokerus = Plain8(plain, pay.pokerus);
        data.metLocation = Plain8(plain, pay.metLocation);
        uint16_t origins = Plain16(plain, pay.origins);
        data.metLevel = origins & 0x7F;
        data.metGame = (origins >> 7) & 0x0F;
        data.pokeball = (origins >> 11) & 0x0F;
        data.otGender = (origins >> 15) & 0x01;

        uint32_t ivWord = Plain32(plain, pay.ivWord);
        for (int i = 0; i < kStatCount; ++i) {
            data.ivs[i] = (ivWord >> (i * 5)) & kIvMask;
        }
        if (pay.ivWordHasFlags) {
            data.isEgg = (ivWord & kEggBit) != 0;
            data.abilityBit = (ivWord & kAbilityBit) ? 1 : 0;
        }
        data.ribbons = Plain32(plain, pay.ribbons);

        data.nature = GetNature();
        data.shinyValue = ShinyValue();
        data.shinyClass = GetShinyClass();
        data.checksumValid = ChecksumValid();

        if (m_kind == RecordKind::Party) {
            data.status = Status();
            data.level = Level();
            data.currentHp = CurrentHp();
            for (int i = 0; i < kStatCount; ++i) {
                data.stats[i] = StatValue(static_cast<Stat>(i));
            }
        }
        return data;
    }

    // ------------------------------------------------------------------
    // Setters

    SaveStatus CreatureRecord::SetEV(Stat stat, int value) {
        if (!ValidStat(stat) || m_profile->payload.evs == kNoField) return SaveStatus::InvalidArgument;
        std::vector<uint8_t> plain = Plain();
        int offset = m_profile->payload.evs + static_cast<int>(stat);
        if (!Has(plain, offset, 1)) return SaveStatus::InvalidArgument;
        plain[offset] = static_cast<uint8_t>(std::clamp(value, 0, 255));
        Commit(plain);
        return SaveStatus::Ok;
    }

    SaveStatus CreatureRecord::SetEVs(const std::array<int, kStatCount>& values) {
        if (m_profile->payload.evs == kNoField) return SaveStatus::InvalidArgument;
        std::vector<uint8_t> plain = Plain();
        if (!Has(plain, m_profile->payload.evs, kStatCount)) return SaveStatus::InvalidArgument;
        for (int i = 0; i < kStatCount; ++i) {
            plain[m_profile->payload.evs + i] = static_cast<uint8_t>(std::clamp(values[i], 0, 255));
        }
        Commit(plain);
        return SaveStatus::Ok;
    }

    SaveStatus CreatureRecord::SetIV(Stat stat, int value) {
        if (!ValidStat(stat)) return SaveStatus::InvalidArgument;
        std::vector<uint8_t> plain = Plain();
        int offset = m_profile->payload.ivWord;
        if (!Has(plain, offset, 4)) return SaveStatus::InvalidArgument;

        int shift = static_cast<int>(stat) * 5;
        uint32_t word = Read32(&plain[offset]);
        word &= ~(kIvMask << shift);
        word |= (static_cast<uint32_t>(std::clamp(value, 0, 31)) & kIvMask) << shift;
        Write32(&plain[offset], word);
        Commit(plain);
        return SaveStatus::Ok;
    }

    SaveStatus CreatureRecord::SetIVs(const std::array<int, kStatCount>& values) {
        std::vector<uint8_t> plain = Plain();
        int offset = m_profile->payload.ivWord;
        if (!Has(plain, offset, 4)) return SaveStatus::InvalidArgument;

        uint32_t word = Read32(&plain[offset]);
        for (int i = 0; i < kStatCount; ++i) {
            int shift = i * 5;
            word &= ~(kIvMask << shift);
            word |= (static_cast<uint32_t>(std::clamp(values[i], 0, 31)) & kIvMask) << shift;
        }
        Write32(&plain[offset], word);
        Commit(plain);
        return SaveStatus::Ok;
    }

    SaveStatus CreatureRecord::SetNature(Nature nature) {
        int index = static_cast<int>(nature);
        if (index < 0 || index >= kNatureCount) return SaveStatus::InvalidArgument;

        uint32_t current = Personality();
        uint32_t next = m_profile->withNature(current, nature);
        if (next == current) return SaveStatus::Ok;

        std::vector<uint8_t> plain = Plain();
        Write32(&m_bytes[m_profile->record.personality], next);
        // Personality seeds both key and order: re-encrypt the same plaintext.
        if (m_profile->encryption.enabled) {
            Commit(plain);
        }
        Logger::Instance().LogFmt(LogLevel::Debug, kLogCategory, "personality 0x%08X -> 0x%08X (%s)",
                                  current, next, NatureName(nature));
        return SaveStatus::Ok;
    }

    SaveStatus CreatureRecord::SetItem(uint16_t itemId) {
        std::vector<uint8_t> plain = Plain();
        int offset = m_profile->payload.item;
        if (!Has(plain, offset, 2)) return SaveStatus::InvalidArgument;
        uint16_t raw = m_profile->tables.items ? m_profile->tables.items->ToRaw(itemId) : itemId;
        Write16(&plain[offset], raw);
        Commit(plain);
        return SaveStatus::Ok;
    }

    SaveStatus CreatureRecord::SetStat(Stat stat, uint16_t value) {
        if (m_kind != RecordKind::Party || !ValidStat(stat)) return SaveStatus::InvalidArgument;
        Write16(&m_bytes[LiveStatOffset(stat)], value);
        return SaveStatus::Ok;
    }

    SaveStatus CreatureRecord::SetStats(const std::array<uint16_t, kStatCount>& values) {
        if (m_kind != RecordKind::Party) return SaveStatus::InvalidArgument;
        for (int i = 0; i < kStatCount; ++i) {
            Write16(&m_bytes[LiveStatOffset(static_cast<Stat>(i))], values[i]);
        }
        return SaveStatus::Ok;
    }

    SaveStatus CreatureRecord::SetCurrentHp(uint16_t value) {
        if (m_kind != RecordKind::Party) return SaveStatus::InvalidArgument;
        Write16(&m_bytes[m_profile->record.currentHp], value);
        return SaveStatus::Ok;
    }

}
