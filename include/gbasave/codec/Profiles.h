#pragma once
#include <vector>

#include "gbasave/codec/GameProfile.h"

namespace GBASave::Codec {

    // 24-row substructure order table, indexed by personality % 24.
    const SubstructOrder& SubstructOrderRow(uint32_t row);

    // Retail Emerald: encrypted records, 14/18 slot split, strict tie-break.
    GameProfile MakeVanillaEmeraldProfile(const LookupTables& tables = LookupTables());

    // Quetzal ROM hack: plain 104-byte records, overlapping 18/18 slots,
    // B wins ties, low-byte nature and byte-coded shiny/radiant.
    GameProfile MakeQuetzalProfile(const LookupTables& tables = LookupTables());

    // Detection priority: most specific first.
    std::vector<GameProfile> DefaultProfiles(const LookupTables& tables = LookupTables());

    // Looks a profile up by name ("emerald", "quetzal"), case-insensitive.
    const GameProfile* FindProfile(const std::vector<GameProfile>& profiles, const std::string& name);

}
