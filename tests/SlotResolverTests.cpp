#include <gtest/gtest.h>

#include "gbasave/codec/Profiles.h"
#include "gbasave/codec/SlotResolver.h"

#include <vector>

using namespace GBASave::Codec;

namespace {

Sector MakeSector(uint32_t index, uint32_t counter, bool valid = true) {
    Sector sector;
    sector.index = index;
    sector.counter = counter;
    sector.present = true;
    sector.valid = valid;
    sector.fault = valid ? SectorFault::None : SectorFault::ChecksumMismatch;
    return sector;
}

} // namespace

TEST(SlotResolverTest, EqualSumsSplitByProfileTieBreak) {
    std::vector<Sector> sectors = {MakeSector(0, 5), MakeSector(20, 5)};

    GameProfile vanilla = MakeVanillaEmeraldProfile();
    SlotResolution strict = SlotResolver::Resolve(sectors, vanilla);
    EXPECT_EQ(strict.sumA, 5u);
    EXPECT_EQ(strict.sumB, 5u);
    EXPECT_EQ(strict.range, SlotRange::A);
    EXPECT_EQ(strict.baseIndex, 0u);

    GameProfile quetzal = MakeQuetzalProfile();
    SlotResolution nonStrict = SlotResolver::Resolve(sectors, quetzal);
    EXPECT_EQ(nonStrict.sumA, 5u);
    EXPECT_EQ(nonStrict.sumB, 5u);
    EXPECT_EQ(nonStrict.range, SlotRange::B);
    EXPECT_EQ(nonStrict.baseIndex, 14u);
}

TEST(SlotResolverTest, LargerSumWinsForBothProfiles) {
    std::vector<Sector> sectors = {MakeSector(1, 10), MakeSector(25, 9)};

    EXPECT_EQ(SlotResolver::Resolve(sectors, MakeVanillaEmeraldProfile()).range, SlotRange::A);
    EXPECT_EQ(SlotResolver::Resolve(sectors, MakeQuetzalProfile()).range, SlotRange::A);

    sectors[1].counter = 11;
    EXPECT_EQ(SlotResolver::Resolve(sectors, MakeVanillaEmeraldProfile()).range, SlotRange::B);
    EXPECT_EQ(SlotResolver::Resolve(sectors, MakeQuetzalProfile()).range, SlotRange::B);
}

TEST(SlotResolverTest, InvalidSectorsDoNotCount) {
    std::vector<Sector> sectors = {MakeSector(2, 3), MakeSector(16, 100, false), MakeSector(17, 1)};

    SlotResolution result = SlotResolver::Resolve(sectors, MakeVanillaEmeraldProfile());
    EXPECT_EQ(result.sumA, 3u);
    EXPECT_EQ(result.sumB, 1u);
    EXPECT_EQ(result.range, SlotRange::A);
}

TEST(SlotResolverTest, OverlappingRangesCountSharedSectorsTwice) {
    // Quetzal's A is 0..17 and B is 14..31: index 15 is in both.
    std::vector<Sector> sectors = {MakeSector(15, 4)};
    SlotResolution result = SlotResolver::Resolve(sectors, MakeQuetzalProfile());
    EXPECT_EQ(result.sumA, 4u);
    EXPECT_EQ(result.sumB, 4u);
    EXPECT_EQ(result.count, 18u);

    // Vanilla ranges are disjoint.
    SlotResolution vanilla = SlotResolver::Resolve(sectors, MakeVanillaEmeraldProfile());
    EXPECT_EQ(vanilla.sumA, 0u);
    EXPECT_EQ(vanilla.sumB, 4u);
}

TEST(SlotResolverTest, CounterSumDoesNotOverflow32Bits) {
    std::vector<Sector> sectors;
    for (uint32_t i = 0; i < 14; ++i) {
        sectors.push_back(MakeSector(i, 0xFFFFFFF0u));
    }
    EXPECT_EQ(SlotResolver::CounterSum(sectors, 0, 14), 14ull * 0xFFFFFFF0ull);
}

TEST(SlotResolverTest, ForcedSlotBypassesTieBreak) {
    std::vector<Sector> sectors = {MakeSector(0, 1), MakeSector(20, 100)};
    GameProfile vanilla = MakeVanillaEmeraldProfile();

    SlotResolution forcedA = SlotResolver::Resolve(sectors, vanilla, SlotPreference::ForceA);
    EXPECT_EQ(forcedA.range, SlotRange::A);
    EXPECT_TRUE(forcedA.forced);
    EXPECT_EQ(forcedA.sumB, 100u);

    SlotResolution forcedB = SlotResolver::Resolve({MakeSector(0, 100)}, vanilla, SlotPreference::ForceB);
    EXPECT_EQ(forcedB.range, SlotRange::B);
    EXPECT_EQ(forcedB.baseIndex, 14u);
    EXPECT_EQ(forcedB.count, 18u);
}
