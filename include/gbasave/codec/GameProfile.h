#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "gbasave/codec/LookupTables.h"
#include "gbasave/codec/Nature.h"

namespace GBASave::Codec {

    enum class ShinyClass {
        Normal,
        Shiny,
        Radiant
    };

    enum class SlotRange {
        A,
        B
    };

    enum class SlotPreference {
        Auto,
        ForceA,
        ForceB
    };

    enum class RecordKind {
        Party,
        Box
    };

    // Stat order used for EVs, IVs and live stats.
    enum class Stat {
        Hp,
        Attack,
        Defense,
        Speed,
        SpAttack,
        SpDefense
    };

    constexpr int kStatCount = 6;

    // Physical substructure position for each logical substructure
    // (Growth, Attacks, Condition, Misc).
    using SubstructOrder = std::array<uint8_t, 4>;

    struct GameProfile;

    using SubstructOrderFn = SubstructOrder (*)(uint32_t personality);
    using NatureFn = Nature (*)(uint32_t personality);
    using NatureWriterFn = uint32_t (*)(uint32_t personality, Nature nature);
    using ShinyValueFn = uint32_t (*)(uint32_t personality, uint32_t otId);
    using ShinyClassFn = ShinyClass (*)(uint32_t personality, uint32_t otId);
    using ActiveSlotFn = SlotRange (*)(uint64_t sumA, uint64_t sumB);

    // Converts between a record's stored bytes and its plain view: the
    // buffer PayloadLayout offsets are relative to.
    struct PayloadCipher {
        std::vector<uint8_t> (*unpack)(const GameProfile& profile, const std::vector<uint8_t>& record);
        void (*pack)(const GameProfile& profile, const std::vector<uint8_t>& plain, std::vector<uint8_t>& record);
        bool (*verify)(const GameProfile& profile, const std::vector<uint8_t>& record);
    };

    struct SectorGeometry {
        uint32_t sectorSize = 0x1000;
        uint32_t footerSize = 12;
        uint32_t payloadSize = 3968;    // bytes covered by the checksum and copied into blocks
        uint32_t sectorCount = 32;
        uint32_t signature = 0x08012025;

        uint32_t FooterOffset() const { return sectorSize - footerSize; }
        size_t ImageSize() const { return static_cast<size_t>(sectorSize) * sectorCount; }
    };

    struct SlotLayout {
        uint32_t firstA = 0;
        uint32_t countA = 14;
        uint32_t firstB = 14;
        uint32_t countB = 18;
    };

    struct TrainerLayout {
        uint16_t logicalId = 0;
        uint32_t nameOffset = 0;
        uint32_t nameLength = 8;
        uint32_t hoursOffset = 0x0E;
        uint32_t minutesOffset = 0x10;
        uint32_t secondsOffset = 0x11;
    };

    struct RosterLayout {
        uint16_t firstLogicalId = 1;
        uint16_t lastLogicalId = 4;
        uint32_t countOffset = 0x234;
        uint32_t partyOffset = 0x238;
        uint32_t maxPartySize = 6;
    };

    // Unencrypted record fields, offsets from the start of the record.
    struct RecordLayout {
        uint32_t partySize = 100;
        uint32_t boxSize = 80;          // 0 when the profile has no box records
        uint32_t personality = 0x00;
        uint32_t otId = 0x04;
        uint32_t nickname = 0x08;
        uint32_t nicknameLength = 10;
        uint32_t language = 0x12;
        uint32_t otName = 0x14;
        uint32_t otNameLength = 7;

        // Party-only live stats
        uint32_t status = 0x50;
        uint32_t level = 0x54;
        uint32_t currentHp = 0x56;
        uint32_t maxHp = 0x58;
        uint32_t attack = 0x5A;
        uint32_t defense = 0x5C;
        uint32_t speed = 0x5E;
        uint32_t spAttack = 0x60;
        uint32_t spDefense = 0x62;
    };

    // Payload fields, offsets into the plain view. kNoField marks a field
    // the profile does not store.
    struct PayloadLayout {
        static constexpr int kNoField = -1;

        int species = 0;
        int item = 2;
        int experience = 4;
        int ppBonuses = 8;
        int friendship = 9;
        int moves = 12;         // 4 x u16
        int pp = 20;            // 4 x u8
        int evs = 24;           // 6 x u8, HP/Atk/Def/Spe/SpA/SpD
        int contest = 30;       // 6 x u8
        int pokerus = 36;
        int metLocation = 37;
        int origins = 38;       // u16: met level, game, ball, OT gender
        int ivWord = 40;        // u32: 6 x 5-bit IVs
        int ribbons = 44;
        bool ivWordHasFlags = true;     // bit 30 egg, bit 31 ability
    };

    struct EncryptionLayout {
        bool enabled = true;
        uint32_t payloadOffset = 0x20;
        uint32_t substructSize = 12;
        uint32_t checksumOffset = 0x1C;

        uint32_t PayloadSize() const { return substructSize * 4; }
    };

    // Emulator RAM addresses of the live party.
    struct MemoryMap {
        bool available = false;
        uint32_t partyCountAddress = 0;
        uint32_t partyAddress = 0;
    };

    // Immutable description of one on-disk layout. Behaviour that differs
    // between games is carried as plain functions; the codec dispatches on
    // these and never on the profile's name.
    struct GameProfile {
        std::string name;

        SectorGeometry geometry;
        SlotLayout slots;
        TrainerLayout trainer;
        RosterLayout roster;
        RecordLayout record;
        PayloadLayout payload;
        EncryptionLayout encryption;
        MemoryMap memory;
        LookupTables tables;

        PayloadCipher cipher{};
        SubstructOrderFn substructOrder = nullptr;
        NatureFn nature = nullptr;
        NatureWriterFn withNature = nullptr;
        ShinyValueFn shinyValue = nullptr;
        ShinyClassFn shinyClass = nullptr;
        ActiveSlotFn activeSlot = nullptr;

        uint32_t RecordSize(RecordKind kind) const {
            return kind == RecordKind::Party ? record.partySize : record.boxSize;
        }
    };

}
