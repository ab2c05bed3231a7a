#include <gtest/gtest.h>

#include "gbasave/codec/Profiles.h"
#include "gbasave/codec/SaveDocument.h"
#include "support/SaveImageBuilder.h"

#include <algorithm>

using namespace GBASave::Codec;
using namespace GBASave::Testing;

namespace {

RecordFields Fields(uint32_t personality, uint16_t species) {
    RecordFields f;
    f.personality = personality;
    f.otId = 0xa18b1c9f;
    f.species = species;
    f.experience = 1000;
    f.friendship = 70;
    f.moves = {33, 45, 0, 0};
    f.pp = {35, 40, 0, 0};
    f.evs = {10, 20, 30, 40, 50, 60};
    f.ivWord = PackIVs({31, 30, 29, 28, 27, 26});
    f.level = 12;
    f.currentHp = 33;
    f.stats = {35, 20, 18, 22, 19, 17};
    return f;
}

std::vector<uint8_t> Vanilla(const RecordFields& f) {
    return VanillaRecord(f, SubstructOrderRow(f.personality % 24));
}

void PutTrainer(SaveImageBuilder& builder, const GameProfile& profile, uint32_t sectorIndex) {
    uint8_t* trainer = builder.Payload(sectorIndex);
    const uint8_t name[] = {0xC7, 0xBB, 0xD3, 0xFF, 0x00, 0x00, 0x00, 0x00};  // MAY
    std::copy(std::begin(name), std::end(name), trainer + profile.trainer.nameOffset);
    Write16(trainer + profile.trainer.hoursOffset, 12);
    trainer[profile.trainer.minutesOffset] = 34;
    trainer[profile.trainer.secondsOffset] = 56;
}

// Trainer in sector 0, roster in sector 1, slot A live.
std::vector<uint8_t> VanillaSave(const GameProfile& profile, const std::vector<std::vector<uint8_t>>& records,
                                 uint32_t count) {
    SaveImageBuilder builder(profile);
    builder.AddSlot(0, 14, 5);
    PutTrainer(builder, profile, 0);
    for (size_t i = 0; i < records.size(); ++i) {
        builder.PutRecord(1, static_cast<uint32_t>(i), records[i]);
    }
    builder.PutPartyCount(1, count);
    return builder.Build();
}

bool SameSector(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b, uint32_t index) {
    const size_t begin = static_cast<size_t>(index) * 0x1000;
    return std::equal(a.begin() + begin, a.begin() + begin + 0x1000, b.begin() + begin);
}

} // namespace

// ============================================================================
// Loading
// ============================================================================

TEST(SaveDocumentTest, LoadsTrainerAndRoster) {
    GameProfile profile = MakeVanillaEmeraldProfile();
    std::vector<uint8_t> image =
        VanillaSave(profile, {Vanilla(Fields(0x6ccbfd84, 277)), Vanilla(Fields(0x00001234, 280))}, 2);

    SaveDocument doc;
    ASSERT_EQ(SaveDocument::Load(image, profile, doc), SaveStatus::Ok);

    EXPECT_EQ(doc.Profile().name, "emerald");
    EXPECT_EQ(doc.Slot().range, SlotRange::A);
    EXPECT_EQ(doc.PlayerName(), "MAY");
    PlayTime time = doc.GetPlayTime();
    EXPECT_EQ(time.hours, 12);
    EXPECT_EQ(time.minutes, 34);
    EXPECT_EQ(time.seconds, 56);
    EXPECT_EQ(doc.StoredPartyCount(), 2u);

    ASSERT_EQ(doc.Roster().size(), 2u);
    EXPECT_EQ(doc.RosterStop(), RosterStopReason::EmptySlot);
    EXPECT_EQ(doc.Roster()[0].SpeciesId(), 277);
    EXPECT_EQ(doc.Roster()[0].GetNature(), Nature::Hasty);
    EXPECT_EQ(doc.Roster()[1].SpeciesId(), 280);
    EXPECT_EQ(doc.Roster()[1].EV(Stat::SpDefense), 60);
    EXPECT_EQ(doc.Roster()[1].IV(Stat::Hp), 31);
    EXPECT_EQ(doc.Member(2), nullptr);
    EXPECT_EQ(doc.Image(), image);
}

TEST(SaveDocumentTest, EmptySlotEndsRosterRegardlessOfCount) {
    GameProfile profile = MakeVanillaEmeraldProfile();
    RecordFields empty = Fields(0x11111111, 0);
    std::vector<uint8_t> image = VanillaSave(
        profile, {Vanilla(Fields(0x01, 277)), Vanilla(Fields(0x02, 278)), Vanilla(empty), Vanilla(Fields(0x04, 279))},
        4);

    SaveDocument doc;
    ASSERT_EQ(SaveDocument::Load(image, profile, doc), SaveStatus::Ok);
    EXPECT_EQ(doc.StoredPartyCount(), 4u);
    ASSERT_EQ(doc.Roster().size(), 2u);
    EXPECT_EQ(doc.RosterStop(), RosterStopReason::EmptySlot);
}

TEST(SaveDocumentTest, StaleRecordChecksumIsKeptAndFlagged) {
    GameProfile profile = MakeVanillaEmeraldProfile();
    std::vector<uint8_t> second = Vanilla(Fields(0x02, 278));
    second[0x1C] ^= 0x01;
    std::vector<uint8_t> image = VanillaSave(profile, {Vanilla(Fields(0x01, 277)), second}, 2);

    SaveDocument doc;
    ASSERT_EQ(SaveDocument::Load(image, profile, doc), SaveStatus::Ok);
    ASSERT_EQ(doc.Roster().size(), 2u);
    EXPECT_EQ(doc.RosterStop(), RosterStopReason::EmptySlot);
    EXPECT_TRUE(doc.Roster()[0].ChecksumValid());
    EXPECT_FALSE(doc.Roster()[1].ChecksumValid());
    EXPECT_FALSE(doc.Roster()[1].Decode().checksumValid);
    EXPECT_EQ(doc.Roster()[1].SpeciesId(), 278);
    EXPECT_EQ(doc.Roster()[1].EV(Stat::Speed), 40);
}

TEST(SaveDocumentTest, FullPartyIsExhausted) {
    GameProfile profile = MakeVanillaEmeraldProfile();
    std::vector<std::vector<uint8_t>> records;
    for (uint32_t i = 0; i < 6; ++i) {
        records.push_back(Vanilla(Fields(0x100 + i, static_cast<uint16_t>(300 + i))));
    }
    SaveDocument doc;
    ASSERT_EQ(SaveDocument::Load(VanillaSave(profile, records, 6), profile, doc), SaveStatus::Ok);
    ASSERT_EQ(doc.Roster().size(), 6u);
    EXPECT_EQ(doc.RosterStop(), RosterStopReason::Exhausted);
    EXPECT_EQ(doc.Roster()[5].SpeciesId(), 305);
}

TEST(SaveDocumentTest, MissingRosterSectorsMeanNoData) {
    GameProfile profile = MakeVanillaEmeraldProfile();
    SaveImageBuilder builder(profile);
    builder.AddSector(0, 0, 1);
    PutTrainer(builder, profile, 0);

    SaveDocument doc;
    ASSERT_EQ(SaveDocument::Load(builder.Build(), profile, doc), SaveStatus::Ok);
    EXPECT_TRUE(doc.Roster().empty());
    EXPECT_EQ(doc.RosterStop(), RosterStopReason::NoData);
    EXPECT_EQ(doc.PlayerName(), "MAY");
    EXPECT_EQ(doc.StoredPartyCount(), 0u);
}

TEST(SaveDocumentTest, MissingTrainerSectorGivesBlankTrainer) {
    GameProfile profile = MakeVanillaEmeraldProfile();
    SaveImageBuilder builder(profile);
    builder.AddSector(1, 1, 1);
    builder.PutRecord(1, 0, Vanilla(Fields(0x01, 277)));

    SaveDocument doc;
    ASSERT_EQ(SaveDocument::Load(builder.Build(), profile, doc), SaveStatus::Ok);
    EXPECT_EQ(doc.PlayerName(), "");
    EXPECT_EQ(doc.GetPlayTime().hours, 0);
    EXPECT_EQ(doc.Roster().size(), 1u);
}

TEST(SaveDocumentTest, RejectsWrongImageSize) {
    GameProfile profile = MakeVanillaEmeraldProfile();
    SaveDocument doc;
    EXPECT_EQ(SaveDocument::Load({}, profile, doc), SaveStatus::MalformedInput);
    EXPECT_EQ(SaveDocument::Load(std::vector<uint8_t>(0x1000 * 31, 0), profile, doc), SaveStatus::MalformedInput);
    EXPECT_EQ(SaveDocument::Load(std::vector<uint8_t>(0x20001, 0), profile, doc), SaveStatus::MalformedInput);
    EXPECT_EQ(SaveDocument::Load(std::vector<uint8_t>(0x20000, 0), profile, doc), SaveStatus::Ok);
}

TEST(SaveDocumentTest, NewerSlotWins) {
    GameProfile profile = MakeVanillaEmeraldProfile();
    SaveImageBuilder builder(profile);
    builder.AddSlot(0, 14, 1);
    builder.AddSlot(14, 14, 2);
    builder.PutRecord(1, 0, Vanilla(Fields(0x01, 100)));
    builder.PutRecord(15, 0, Vanilla(Fields(0x01, 200)));
    std::vector<uint8_t> image = builder.Build();

    SaveDocument doc;
    ASSERT_EQ(SaveDocument::Load(image, profile, doc), SaveStatus::Ok);
    EXPECT_EQ(doc.Slot().range, SlotRange::B);
    ASSERT_EQ(doc.Roster().size(), 1u);
    EXPECT_EQ(doc.Roster()[0].SpeciesId(), 200);

    ParseOptions forced;
    forced.slot = SlotPreference::ForceA;
    ASSERT_EQ(SaveDocument::Load(image, profile, doc, forced), SaveStatus::Ok);
    EXPECT_EQ(doc.Slot().range, SlotRange::A);
    EXPECT_EQ(doc.Roster()[0].SpeciesId(), 100);
}

// ============================================================================
// Reconstruction
// ============================================================================

TEST(SaveDocumentTest, UnmodifiedReconstructIsIdentical) {
    GameProfile profile = MakeVanillaEmeraldProfile();
    std::vector<uint8_t> image =
        VanillaSave(profile, {Vanilla(Fields(0x6ccbfd84, 277)), Vanilla(Fields(0x00001234, 280))}, 2);

    SaveDocument doc;
    ASSERT_EQ(SaveDocument::Load(image, profile, doc), SaveStatus::Ok);
    std::vector<uint8_t> rebuilt;
    ASSERT_EQ(doc.Reconstruct(rebuilt), SaveStatus::Ok);
    EXPECT_EQ(rebuilt, image);
}

TEST(SaveDocumentTest, EditedRecordSurvivesReload) {
    GameProfile profile = MakeVanillaEmeraldProfile();
    std::vector<uint8_t> image =
        VanillaSave(profile, {Vanilla(Fields(0x6ccbfd84, 277)), Vanilla(Fields(0x00001234, 280))}, 2);

    SaveDocument doc;
    ASSERT_EQ(SaveDocument::Load(image, profile, doc), SaveStatus::Ok);
    CreatureData before = doc.Roster()[1].Decode();

    CreatureRecord* member = doc.Member(1);
    ASSERT_NE(member, nullptr);
    ASSERT_EQ(member->SetEV(Stat::Attack, 252), SaveStatus::Ok);
    ASSERT_EQ(member->SetNature(Nature::Adamant), SaveStatus::Ok);

    std::vector<uint8_t> rebuilt;
    ASSERT_EQ(doc.Reconstruct(rebuilt), SaveStatus::Ok);
    EXPECT_EQ(doc.Image(), image);

    // Only the roster sector differs.
    for (uint32_t index = 0; index < 32; ++index) {
        if (index == 1) continue;
        EXPECT_TRUE(SameSector(image, rebuilt, index)) << "sector " << index;
    }

    SaveDocument reloaded;
    ASSERT_EQ(SaveDocument::Load(rebuilt, profile, reloaded), SaveStatus::Ok);
    ASSERT_EQ(reloaded.Roster().size(), 2u);
    CreatureData after = reloaded.Roster()[1].Decode();
    EXPECT_TRUE(reloaded.Sectors()[1].valid);
    EXPECT_EQ(after.evs[1], 252);
    EXPECT_EQ(after.nature, Nature::Adamant);
    EXPECT_EQ(after.evs[0], before.evs[0]);
    EXPECT_EQ(after.ivs, before.ivs);
    EXPECT_EQ(after.moves, before.moves);
    EXPECT_EQ(after.speciesId, before.speciesId);
    EXPECT_EQ(after.stats, before.stats);
    EXPECT_EQ(reloaded.Roster()[0].Bytes(), doc.Roster()[0].Bytes());
    EXPECT_EQ(reloaded.StoredPartyCount(), 2u);
}

TEST(SaveDocumentTest, QuetzalRoundTrip) {
    GameProfile profile = MakeQuetzalProfile();
    SaveImageBuilder builder(profile);
    builder.AddSlot(0, 14, 3);
    PutTrainer(builder, profile, 0);
    RecordFields fields = Fields(0x00000184, 277);
    builder.PutRecord(1, 0, QuetzalRecord(fields));
    builder.PutPartyCount(1, 1);
    std::vector<uint8_t> image = builder.Build();

    SaveDocument doc;
    ASSERT_EQ(SaveDocument::Load(image, profile, doc), SaveStatus::Ok);
    EXPECT_EQ(doc.PlayerName(), "MAY");
    EXPECT_EQ(doc.GetPlayTime().minutes, 34);
    ASSERT_EQ(doc.Roster().size(), 1u);
    EXPECT_TRUE(doc.Roster()[0].IsShiny());

    std::vector<uint8_t> rebuilt;
    ASSERT_EQ(doc.Reconstruct(rebuilt), SaveStatus::Ok);
    EXPECT_EQ(rebuilt, image);

    ASSERT_EQ(doc.Member(0)->SetIV(Stat::Speed, 0), SaveStatus::Ok);
    ASSERT_EQ(doc.Reconstruct(rebuilt), SaveStatus::Ok);

    SaveDocument reloaded;
    ASSERT_EQ(SaveDocument::Load(rebuilt, profile, reloaded), SaveStatus::Ok);
    ASSERT_EQ(reloaded.Roster().size(), 1u);
    EXPECT_EQ(reloaded.Roster()[0].IV(Stat::Speed), 0);
    EXPECT_EQ(reloaded.Roster()[0].IV(Stat::Hp), 31);
}

TEST(SaveDocumentTest, ReconstructWritesOnlyTheActiveSlot) {
    GameProfile profile = MakeVanillaEmeraldProfile();
    SaveImageBuilder builder(profile);
    builder.AddSlot(0, 14, 1);
    builder.AddSlot(14, 14, 2);
    builder.PutRecord(1, 0, Vanilla(Fields(0x01, 100)));
    builder.PutRecord(15, 0, Vanilla(Fields(0x01, 200)));
    std::vector<uint8_t> image = builder.Build();

    SaveDocument doc;
    ASSERT_EQ(SaveDocument::Load(image, profile, doc), SaveStatus::Ok);
    ASSERT_EQ(doc.Member(0)->SetEV(Stat::Hp, 1), SaveStatus::Ok);

    std::vector<uint8_t> rebuilt;
    ASSERT_EQ(doc.Reconstruct(rebuilt), SaveStatus::Ok);
    EXPECT_FALSE(SameSector(image, rebuilt, 15));
    EXPECT_TRUE(SameSector(image, rebuilt, 1));
}

TEST(SaveDocumentTest, ReconstructFromBaseImage) {
    GameProfile profile = MakeVanillaEmeraldProfile();
    std::vector<uint8_t> base = VanillaSave(profile, {Vanilla(Fields(0x01, 277))}, 1);

    auto replacement = CreatureRecord::FromBytes(Vanilla(Fields(0x05, 390)), profile);
    ASSERT_TRUE(replacement.has_value());

    std::vector<uint8_t> rebuilt;
    ASSERT_EQ(SaveDocument::Reconstruct(base, {*replacement, *replacement}, profile, rebuilt), SaveStatus::Ok);

    SaveDocument doc;
    ASSERT_EQ(SaveDocument::Load(rebuilt, profile, doc), SaveStatus::Ok);
    ASSERT_EQ(doc.Roster().size(), 2u);
    EXPECT_EQ(doc.Roster()[1].SpeciesId(), 390);
    // The party count is left for the caller to manage.
    EXPECT_EQ(doc.StoredPartyCount(), 1u);

    std::vector<uint8_t> untouched;
    ASSERT_EQ(SaveDocument::Reconstruct(base, {}, profile, untouched), SaveStatus::Ok);
    EXPECT_EQ(untouched, base);
}

TEST(SaveDocumentTest, RosterOutlivesItsDocument) {
    GameProfile profile = MakeVanillaEmeraldProfile();
    std::vector<uint8_t> base = VanillaSave(profile, {Vanilla(Fields(0x6ccbfd84, 277))}, 1);

    std::vector<CreatureRecord> roster;
    {
        SaveDocument doc;
        ASSERT_EQ(SaveDocument::Load(base, profile, doc), SaveStatus::Ok);
        roster = doc.Roster();
    }
    ASSERT_EQ(roster.size(), 1u);
    ASSERT_EQ(roster[0].SetEV(Stat::Attack, 10), SaveStatus::Ok);
    EXPECT_EQ(roster[0].Profile().name, "emerald");

    std::vector<uint8_t> rebuilt;
    ASSERT_EQ(SaveDocument::Reconstruct(base, roster, profile, rebuilt), SaveStatus::Ok);

    // Reloading in place replaces the document that produced the roster.
    SaveDocument doc;
    ASSERT_EQ(SaveDocument::Load(rebuilt, profile, doc), SaveStatus::Ok);
    std::vector<CreatureRecord> copy = doc.Roster();
    ASSERT_EQ(SaveDocument::Load(base, profile, doc), SaveStatus::Ok);
    ASSERT_EQ(copy.size(), 1u);
    EXPECT_EQ(copy[0].EV(Stat::Attack), 10);
    EXPECT_EQ(copy[0].GetNature(), Nature::Hasty);
    EXPECT_EQ(doc.Roster()[0].EV(Stat::Attack), 20);
}

TEST(SaveDocumentTest, ReconstructFailures) {
    GameProfile vanilla = MakeVanillaEmeraldProfile();
    GameProfile quetzal = MakeQuetzalProfile();
    std::vector<uint8_t> base = VanillaSave(vanilla, {Vanilla(Fields(0x01, 277))}, 1);
    auto record = CreatureRecord::FromBytes(Vanilla(Fields(0x01, 277)), vanilla);
    ASSERT_TRUE(record.has_value());
    std::vector<uint8_t> out(1, 0xEE);

    std::vector<CreatureRecord> seven(7, *record);
    EXPECT_EQ(SaveDocument::Reconstruct(base, seven, vanilla, out), SaveStatus::RosterTooLong);

    auto foreign = CreatureRecord::FromBytes(QuetzalRecord(Fields(0x01, 277)), quetzal);
    ASSERT_TRUE(foreign.has_value());
    EXPECT_EQ(SaveDocument::Reconstruct(base, {*foreign}, vanilla, out), SaveStatus::RecordSizeMismatch);

    std::vector<uint8_t> broken = base;
    broken[0x1000 + 10] ^= 0xFF;    // roster sector fails its checksum
    EXPECT_EQ(SaveDocument::Reconstruct(broken, {*record}, vanilla, out), SaveStatus::MissingSector);

    EXPECT_EQ(SaveDocument::Reconstruct(std::vector<uint8_t>(100, 0), {*record}, vanilla, out),
              SaveStatus::MalformedInput);

    // Failed calls leave the output alone.
    EXPECT_EQ(out, std::vector<uint8_t>(1, 0xEE));
}

TEST(SaveDocumentTest, LoadDetectPicksMatchingProfile) {
    std::vector<GameProfile> profiles = DefaultProfiles();
    GameProfile vanilla = MakeVanillaEmeraldProfile();
    std::vector<uint8_t> image = VanillaSave(vanilla, {Vanilla(Fields(0x6ccbfd84, 277))}, 1);

    SaveDocument doc;
    ASSERT_EQ(SaveDocument::LoadDetect(image, profiles, doc), SaveStatus::Ok);
    EXPECT_EQ(doc.Profile().name, "emerald");
    EXPECT_EQ(doc.Roster().size(), 1u);

    EXPECT_EQ(SaveDocument::LoadDetect(std::vector<uint8_t>(0x20000, 0), profiles, doc), SaveStatus::UnsupportedGame);
}

TEST(SaveDocumentTest, LoadDetectIgnoresStaleRecordChecksum) {
    std::vector<GameProfile> profiles = DefaultProfiles();
    GameProfile vanilla = MakeVanillaEmeraldProfile();
    std::vector<uint8_t> record = Vanilla(Fields(0x6ccbfd84, 277));
    record[0x1C] ^= 0x01;
    std::vector<uint8_t> image = VanillaSave(vanilla, {record}, 1);

    SaveDocument doc;
    ASSERT_EQ(SaveDocument::LoadDetect(image, profiles, doc), SaveStatus::Ok);
    EXPECT_EQ(doc.Profile().name, "emerald");
    ASSERT_EQ(doc.Roster().size(), 1u);
    EXPECT_FALSE(doc.Roster()[0].ChecksumValid());
    EXPECT_EQ(doc.Roster()[0].SpeciesId(), 277);
}
