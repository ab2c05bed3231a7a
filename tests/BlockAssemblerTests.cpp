#include <gtest/gtest.h>

#include "gbasave/codec/BlockAssembler.h"
#include "gbasave/codec/Profiles.h"
#include "support/SaveImageBuilder.h"

#include <algorithm>

using namespace GBASave::Codec;
using GBASave::Testing::SaveImageBuilder;

namespace {

// Slot A of a vanilla image; the payload of logical id n is filled with 0x10 + n.
std::vector<uint8_t> MarkedImage(const GameProfile& profile) {
    SaveImageBuilder builder(profile);
    builder.AddSlot(0, 14, 1);
    for (uint32_t id = 0; id < 14; ++id) {
        std::fill(builder.Payload(id), builder.Payload(id) + profile.geometry.payloadSize,
                  static_cast<uint8_t>(0x10 + id));
    }
    return builder.Build();
}

SectorMap MapFor(const std::vector<uint8_t>& image, const GameProfile& profile) {
    std::vector<Sector> sectors = SectorStore::Validate(image, profile);
    return BlockAssembler::BuildSectorMap(sectors, SlotResolver::Resolve(sectors, profile));
}

} // namespace

TEST(BlockAssemblerTest, ConcatenatesPayloadsInLogicalOrder) {
    GameProfile profile = MakeVanillaEmeraldProfile();
    std::vector<uint8_t> image = MarkedImage(profile);
    SectorMap map = MapFor(image, profile);

    std::vector<uint8_t> block = BlockAssembler::Assemble(image, map, profile, 1, 4);
    ASSERT_EQ(block.size(), 4u * 3968u);
    for (uint32_t chunk = 0; chunk < 4; ++chunk) {
        EXPECT_EQ(block[chunk * 3968], 0x11 + chunk);
        EXPECT_EQ(block[chunk * 3968 + 3967], 0x11 + chunk);
    }
}

TEST(BlockAssemblerTest, UsesLogicalIdNotPhysicalIndex) {
    GameProfile profile = MakeVanillaEmeraldProfile();
    SaveImageBuilder builder(profile);
    // Rotated slot: logical id 1 lives in physical sector 9.
    builder.AddSector(9, 1, 3);
    std::fill(builder.Payload(9), builder.Payload(9) + 3968, 0x77);
    std::vector<uint8_t> image = builder.Build();

    SectorMap map = MapFor(image, profile);
    ASSERT_EQ(map.count(1), 1u);
    EXPECT_EQ(map.at(1), 9u);

    std::vector<uint8_t> block = BlockAssembler::Assemble(image, map, profile, 1, 4);
    EXPECT_EQ(block[0], 0x77);
    EXPECT_EQ(block[3968], 0x00);
}

TEST(BlockAssemblerTest, MissingIdLeavesZeroRegion) {
    GameProfile profile = MakeVanillaEmeraldProfile();
    std::vector<uint8_t> image = MarkedImage(profile);
    image[3 * 0x1000 + 5] ^= 0xFF;  // break logical id 3's checksum

    SectorMap map = MapFor(image, profile);
    EXPECT_EQ(map.count(3), 0u);

    std::vector<uint8_t> block = BlockAssembler::Assemble(image, map, profile, 1, 4);
    EXPECT_EQ(block[0], 0x11);
    EXPECT_EQ(block[1 * 3968], 0x12);
    EXPECT_TRUE(std::all_of(block.begin() + 2 * 3968, block.begin() + 3 * 3968, [](uint8_t b) { return b == 0; }));
    EXPECT_EQ(block[3 * 3968], 0x14);
}

TEST(BlockAssemblerTest, NoIdsPresentYieldsZeroBlock) {
    GameProfile profile = MakeVanillaEmeraldProfile();
    std::vector<uint8_t> image(profile.geometry.ImageSize(), 0xCC);

    SectorMap map = MapFor(image, profile);
    EXPECT_TRUE(map.empty());

    std::vector<uint8_t> block = BlockAssembler::Assemble(image, map, profile, 1, 4);
    ASSERT_EQ(block.size(), 4u * 3968u);
    EXPECT_TRUE(std::all_of(block.begin(), block.end(), [](uint8_t b) { return b == 0; }));
}

TEST(BlockAssemblerTest, LaterSectorWinsDuplicateLogicalId) {
    GameProfile profile = MakeVanillaEmeraldProfile();
    SaveImageBuilder builder(profile);
    builder.AddSector(2, 1, 1);
    builder.AddSector(6, 1, 1);
    std::vector<uint8_t> image = builder.Build();

    SectorMap map = MapFor(image, profile);
    EXPECT_EQ(map.at(1), 6u);
}

TEST(BlockAssemblerTest, MapIgnoresSectorsOutsideActiveSlot) {
    GameProfile profile = MakeVanillaEmeraldProfile();
    SaveImageBuilder builder(profile);
    builder.AddSlot(0, 14, 5);
    builder.AddSector(20, 1, 1);    // slot B, lower counter
    std::vector<uint8_t> image = builder.Build();

    SectorMap map = MapFor(image, profile);
    EXPECT_EQ(map.size(), 14u);
    EXPECT_EQ(map.at(1), 1u);
}

TEST(BlockAssemblerTest, ScatterWritesChunkAndRefreshesChecksum) {
    GameProfile profile = MakeVanillaEmeraldProfile();
    std::vector<uint8_t> image = MarkedImage(profile);
    SectorMap map = MapFor(image, profile);

    std::vector<uint8_t> block = BlockAssembler::Assemble(image, map, profile, 1, 4);
    block[3968 + 100] = 0xAB;     // inside logical id 2

    std::vector<uint8_t> patched = image;
    ASSERT_TRUE(BlockAssembler::Scatter(block, patched, map, profile, 1, {2}));

    EXPECT_EQ(patched[2 * 0x1000 + 100], 0xAB);
    Sector sector = SectorStore::ReadSector(patched, 2, profile);
    EXPECT_TRUE(sector.valid);
    EXPECT_NE(sector.storedChecksum, SectorStore::ReadSector(image, 2, profile).storedChecksum);

    // Other sectors untouched
    EXPECT_TRUE(std::equal(image.begin() + 3 * 0x1000, image.end(), patched.begin() + 3 * 0x1000));
    EXPECT_TRUE(std::equal(image.begin(), image.begin() + 2 * 0x1000, patched.begin()));
}

TEST(BlockAssemblerTest, ScatterReportsIdsItCouldNotPlace) {
    GameProfile profile = MakeVanillaEmeraldProfile();
    SaveImageBuilder builder(profile);
    builder.AddSector(1, 1, 1);
    std::vector<uint8_t> image = builder.Build();
    SectorMap map = MapFor(image, profile);

    std::vector<uint8_t> block = BlockAssembler::Assemble(image, map, profile, 1, 4);
    std::vector<uint8_t> patched = image;
    EXPECT_FALSE(BlockAssembler::Scatter(block, patched, map, profile, 1, {1, 2}));
    EXPECT_EQ(patched, image);
}
