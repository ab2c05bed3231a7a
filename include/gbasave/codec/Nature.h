#pragma once
#include <cstdint>
#include <string>

namespace GBASave::Codec {

    enum class Nature : uint8_t {
        Hardy, Lonely, Brave, Adamant, Naughty,
        Bold, Docile, Relaxed, Impish, Lax,
        Timid, Hasty, Serious, Jolly, Naive,
        Modest, Mild, Quiet, Bashful, Rash,
        Calm, Gentle, Sassy, Careful, Quirky
    };

    constexpr int kNatureCount = 25;

    // Stat indices (1 = Attack .. 5 = Sp. Defense) raised and lowered by a
    // nature. Both are -1 for the five neutral natures.
    struct NatureEffect {
        int increased = -1;
        int decreased = -1;

        bool IsNeutral() const { return increased < 0; }
    };

    const char* NatureName(Nature nature);
    NatureEffect GetNatureEffect(Nature nature);

    // Accepts a case-insensitive name ("hasty") or an index ("11").
    bool ParseNature(const std::string& text, Nature& out);

}
