#include "gbasave/codec/Profiles.h"
#include "gbasave/codec/PayloadCipher.h"

#include <algorithm>
#include <cctype>

namespace GBASave::Codec {

    namespace {
        // row[p % 24][logical] = physical substructure position
        const SubstructOrder kSubstructOrders[24] = {
            {{0, 1, 2, 3}}, {{0, 1, 3, 2}}, {{0, 2, 1, 3}}, {{0, 3, 1, 2}},
            {{0, 2, 3, 1}}, {{0, 3, 2, 1}}, {{1, 0, 2, 3}}, {{1, 0, 3, 2}},
            {{2, 0, 1, 3}}, {{3, 0, 1, 2}}, {{2, 0, 3, 1}}, {{3, 0, 2, 1}},
            {{1, 2, 0, 3}}, {{1, 3, 0, 2}}, {{2, 1, 0, 3}}, {{3, 1, 0, 2}},
            {{2, 3, 0, 1}}, {{3, 2, 0, 1}}, {{1, 2, 3, 0}}, {{1, 3, 2, 0}},
            {{2, 1, 3, 0}}, {{3, 1, 2, 0}}, {{2, 3, 1, 0}}, {{3, 2, 1, 0}}
        };

        constexpr uint32_t kVanillaShinyThreshold = 8;
        constexpr uint32_t kQuetzalShinyByte = 1;
        constexpr uint32_t kQuetzalRadiantByte = 2;

        // --- Vanilla Emerald policies ---

        SubstructOrder VanillaOrder(uint32_t personality) {
            return kSubstructOrders[personality % 24];
        }

        Nature VanillaNature(uint32_t personality) {
            return static_cast<Nature>(personality % kNatureCount);
        }

        uint32_t VanillaWithNature(uint32_t personality, Nature nature) {
            uint64_t next = static_cast<uint64_t>(personality) - personality % kNatureCount +
                            static_cast<uint64_t>(nature);
            if (next > 0xFFFFFFFFull) next -= kNatureCount;
            return static_cast<uint32_t>(next);
        }

        uint32_t VanillaShinyValue(uint32_t personality, uint32_t otId) {
            uint32_t tid = otId & 0xFFFF;
            uint32_t sid = (otId >> 16) & 0xFFFF;
            return tid ^ sid ^ (personality & 0xFFFF) ^ ((personality >> 16) & 0xFFFF);
        }

        ShinyClass VanillaShinyClass(uint32_t personality, uint32_t otId) {
            return VanillaShinyValue(personality, otId) < kVanillaShinyThreshold ? ShinyClass::Shiny
                                                                                  : ShinyClass::Normal;
        }

        SlotRange StrictActiveSlot(uint64_t sumA, uint64_t sumB) {
            return sumB > sumA ? SlotRange::B : SlotRange::A;
        }

        // --- Quetzal policies ---

        SubstructOrder IdentityOrder(uint32_t) {
            return kSubstructOrders[0];
        }

        Nature QuetzalNature(uint32_t personality) {
            return static_cast<Nature>((personality & 0xFF) % kNatureCount);
        }

        uint32_t QuetzalWithNature(uint32_t personality, Nature nature) {
            uint32_t low = personality & 0xFF;
            uint32_t next = low - low % kNatureCount + static_cast<uint32_t>(nature);
            if (next > 0xFF) next -= kNatureCount;
            return (personality & ~0xFFu) | next;
        }

        uint32_t QuetzalShinyValue(uint32_t personality, uint32_t) {
            return (personality >> 8) & 0xFF;
        }

        ShinyClass QuetzalShinyClass(uint32_t personality, uint32_t otId) {
            uint32_t value = QuetzalShinyValue(personality, otId);
            if (value == kQuetzalShinyByte) return ShinyClass::Shiny;
            if (value == kQuetzalRadiantByte) return ShinyClass::Radiant;
            return ShinyClass::Normal;
        }

        SlotRange NonStrictActiveSlot(uint64_t sumA, uint64_t sumB) {
            return sumB >= sumA ? SlotRange::B : SlotRange::A;
        }

        std::string Lower(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }
    }

    const SubstructOrder& SubstructOrderRow(uint32_t row) {
        return kSubstructOrders[row % 24];
    }

    GameProfile MakeVanillaEmeraldProfile(const LookupTables& tables) {
        GameProfile profile;
        profile.name = "emerald";
        profile.tables = tables;

        // Geometry, slots, trainer, roster, record and payload defaults
        // describe the retail layout already.
        profile.memory.available = true;
        profile.memory.partyCountAddress = 0x020244E9;
        profile.memory.partyAddress = 0x020244EC;

        profile.cipher = XorPermutationCipher();
        profile.substructOrder = &VanillaOrder;
        profile.nature = &VanillaNature;
        profile.withNature = &VanillaWithNature;
        profile.shinyValue = &VanillaShinyValue;
        profile.shinyClass = &VanillaShinyClass;
        profile.activeSlot = &StrictActiveSlot;
        return profile;
    }

    GameProfile MakeQuetzalProfile(const LookupTables& tables) {
        GameProfile profile;
        profile.name = "quetzal";
        profile.tables = tables;

        profile.slots.firstA = 0;
        profile.slots.countA = 18;
        profile.slots.firstB = 14;
        profile.slots.countB = 18;

        profile.trainer.hoursOffset = 0x10;
        profile.trainer.minutesOffset = 0x14;
        profile.trainer.secondsOffset = 0x15;

        profile.roster.countOffset = 0x6A4;
        profile.roster.partyOffset = 0x6A8;

        RecordLayout& rec = profile.record;
        rec.partySize = 104;
        rec.boxSize = 0;
        rec.currentHp = 0x23;
        rec.status = 0x57;
        rec.level = 0x58;
        rec.maxHp = 0x5A;
        rec.attack = 0x5C;
        rec.defense = 0x5E;
        rec.speed = 0x60;
        rec.spAttack = 0x62;
        rec.spDefense = 0x64;

        // Offsets are record-relative: the plain view is the whole record.
        // Growth/Attacks/Condition/Misc sit in fixed order from 0x28; fields
        // past the moves follow that order.
        PayloadLayout& pay = profile.payload;
        pay.species = 0x28;
        pay.item = 0x2A;
        pay.experience = 0x2C;
        pay.ppBonuses = 0x30;
        pay.friendship = 0x31;
        pay.moves = 0x34;
        pay.pp = 0x3C;
        pay.evs = 0x40;
        pay.contest = 0x46;
        pay.pokerus = 0x4C;
        pay.metLocation = 0x4D;
        pay.origins = 0x4E;
        pay.ivWord = 0x50;
        pay.ribbons = PayloadLayout::kNoField;     // overlaps the live status byte
        pay.ivWordHasFlags = false;

        profile.encryption.enabled = false;

        profile.cipher = PlainCipher();
        profile.substructOrder = &IdentityOrder;
        profile.nature = &QuetzalNature;
        profile.withNature = &QuetzalWithNature;
        profile.shinyValue = &QuetzalShinyValue;
        profile.shinyClass = &QuetzalShinyClass;
        profile.activeSlot = &NonStrictActiveSlot;
        return profile;
    }

    std::vector<GameProfile> DefaultProfiles(const LookupTables& tables) {
        std::vector<GameProfile> profiles;
        profiles.push_back(MakeQuetzalProfile(tables));
        profiles.push_back(MakeVanillaEmeraldProfile(tables));
        return profiles;
    }

    const GameProfile* FindProfile(const std::vector<GameProfile>& profiles, const std::string& name) {
        std::string wanted = Lower(name);
        for (const GameProfile& profile : profiles) {
            if (Lower(profile.name) == wanted) return &profile;
        }
        return nullptr;
    }

}
