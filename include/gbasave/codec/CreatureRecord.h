#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "gbasave/codec/GameProfile.h"
#include "gbasave/codec/SaveStatus.h"

namespace GBASave::Codec {

    // Snapshot of every decoded field of one record.
    struct CreatureData {
        uint32_t personality = 0;
        uint32_t otId = 0;
        std::string nickname;
        std::string otName;
        uint8_t language = 0;

        uint16_t speciesId = 0;
        uint16_t rawSpeciesId = 0;
        std::string speciesName;
        uint16_t itemId = 0;
        uint16_t rawItemId = 0;
        uint32_t experience = 0;
        uint8_t ppBonuses = 0;
        uint8_t friendship = 0;

        std::array<uint16_t, 4> moves{};
        std::array<uint16_t, 4> rawMoves{};
        std::array<uint8_t, 4> pp{};

        std::array<uint8_t, kStatCount> evs{};
        std::array<uint8_t, 6> contest{};   // cool, beauty, cute, smart, tough, sheen

        uint8_t pokerus = 0;
        uint8_t metLocation = 0;
        uint8_t metLevel = 0;
        uint8_t metGame = 0;
        uint8_t pokeball = 0;
        uint8_t otGender = 0;

        std::array<uint8_t, kStatCount> ivs{};
        bool isEgg = false;
        uint8_t abilityBit = 0;
        uint32_t ribbons = 0;

        Nature nature = Nature::Hardy;
        uint32_t shinyValue = 0;
        ShinyClass shinyClass = ShinyClass::Normal;
        bool checksumValid = true;

        // Party records only; zero for box records.
        uint8_t status = 0;
        uint8_t level = 0;
        uint16_t currentHp = 0;
        std::array<uint16_t, kStatCount> stats{};   // HP slot holds max HP
    };

    /**
     * One creature record, owning a copy of its bytes.
     *
     * Getters decode on demand from the stored bytes. Setters write through
     * immediately, re-encrypting where the profile encrypts, and never touch
     * bytes that belong to another field. Records share ownership of their
     * profile, so a copied roster stays usable after its document is gone.
     */
    class CreatureRecord {
    public:
        // Fails when the size does not match the profile's record size for the kind.
        static std::optional<CreatureRecord> FromBytes(const uint8_t* data, size_t size, const GameProfile& profile,
                                                       RecordKind kind = RecordKind::Party);
        static std::optional<CreatureRecord> FromBytes(const std::vector<uint8_t>& bytes, const GameProfile& profile,
                                                       RecordKind kind = RecordKind::Party);
        static std::optional<CreatureRecord> FromBytes(const uint8_t* data, size_t size,
                                                       std::shared_ptr<const GameProfile> profile,
                                                       RecordKind kind = RecordKind::Party);

        const GameProfile& Profile() const { return *m_profile; }
        RecordKind Kind() const { return m_kind; }
        const std::vector<uint8_t>& Bytes() const { return m_bytes; }

        // Raw species 0 marks an empty slot.
        bool IsEmpty() const;
        bool ChecksumValid() const;

        // Header
        uint32_t Personality() const;
        uint32_t OtId() const;
        uint16_t DisplayOtId() const;
        std::string Nickname() const;
        std::string OtName() const;
        uint8_t Language() const;

        // Payload
        uint16_t SpeciesId() const;
        uint16_t RawSpeciesId() const;
        std::string SpeciesName() const;
        uint16_t ItemId() const;
        uint16_t RawItemId() const;
        uint32_t Experience() const;
        uint8_t PpBonuses() const;
        uint8_t Friendship() const;
        uint16_t Move(int slot) const;
        uint16_t RawMove(int slot) const;
        uint8_t Pp(int slot) const;
        uint8_t EV(Stat stat) const;
        std::array<uint8_t, kStatCount> EVs() const;
        int EVTotal() const;
        uint8_t Contest(int index) const;
        uint8_t Pokerus() const;
        uint8_t MetLocation() const;
        uint8_t MetLevel() const;
        uint8_t MetGame() const;
        uint8_t Pokeball() const;
        uint8_t OtGender() const;
        uint8_t IV(Stat stat) const;
        std::array<uint8_t, kStatCount> IVs() const;
        int IVTotal() const;
        bool IsEgg() const;
        uint8_t AbilityBit() const;
        uint32_t Ribbons() const;

        // Derived from personality / otId through the profile
        Nature GetNature() const;
        NatureEffect GetNatureEffect() const;
        uint32_t ShinyValue() const;
        ShinyClass GetShinyClass() const;
        bool IsShiny() const { return GetShinyClass() == ShinyClass::Shiny; }
        bool IsRadiant() const { return GetShinyClass() == ShinyClass::Radiant; }

        // Party-only live stats
        uint8_t Status() const;
        uint8_t Level() const;
        uint16_t CurrentHp() const;
        uint16_t MaxHp() const { return StatValue(Stat::Hp); }
        uint16_t StatValue(Stat stat) const;

        CreatureData Decode() const;

        // Setters. Out-of-range values clamp (EV 0..255, IV 0..31);
        // invalid stat/nature indices return InvalidArgument and write nothing.
        SaveStatus SetEV(Stat stat, int value);
        SaveStatus SetEVs(const std::array<int, kStatCount>& values);
        SaveStatus SetIV(Stat stat, int value);
        SaveStatus SetIVs(const std::array<int, kStatCount>& values);
        SaveStatus SetNature(Nature nature);
        SaveStatus SetItem(uint16_t itemId);
        SaveStatus SetStat(Stat stat, uint16_t value);
        SaveStatus SetStats(const std::array<uint16_t, kStatCount>& values);
        SaveStatus SetCurrentHp(uint16_t value);

    private:
        CreatureRecord(std::shared_ptr<const GameProfile> profile, RecordKind kind, std::vector<uint8_t> bytes);

        std::vector<uint8_t> Plain() const;
        void Commit(const std::vector<uint8_t>& plain);
        const GlyphTable& Glyphs() const;
        int LiveStatOffset(Stat stat) const;

        std::shared_ptr<const GameProfile> m_profile;
        RecordKind m_kind;
        std::vector<uint8_t> m_bytes;
    };

}
