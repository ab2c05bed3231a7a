#include "gbasave/codec/Nature.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace GBASave::Codec {

    namespace {
        const char* const kNatureNames[kNatureCount] = {
            "Hardy", "Lonely", "Brave", "Adamant", "Naughty",
            "Bold", "Docile", "Relaxed", "Impish", "Lax",
            "Timid", "Hasty", "Serious", "Jolly", "Naive",
            "Modest", "Mild", "Quiet", "Bashful", "Rash",
            "Calm", "Gentle", "Sassy", "Careful", "Quirky"
        };

        std::string Lower(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }
    }

    const char* NatureName(Nature nature) {
        int index = static_cast<int>(nature);
        if (index < 0 || index >= kNatureCount) return "Unknown";
        return kNatureNames[index];
    }

    NatureEffect GetNatureEffect(Nature nature) {
        // Natures are laid out as a 5x5 grid over Atk/Def/Spe/SpA/SpD:
        // row = raised stat, column = lowered stat. The diagonal is neutral.
        int index = static_cast<int>(nature);
        int up = index / 5;
        int down = index % 5;
        NatureEffect effect;
        if (up != down) {
            effect.increased = up + 1;
            effect.decreased = down + 1;
        }
        return effect;
    }

    bool ParseNature(const std::string& text, Nature& out) {
        if (text.empty()) return false;

        if (std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
            if (text.size() > 2) return false;
            int index = std::atoi(text.c_str());
            if (index >= kNatureCount) return false;
            out = static_cast<Nature>(index);
            return true;
        }

        std::string wanted = Lower(text);
        for (int i = 0; i < kNatureCount; ++i) {
            if (Lower(kNatureNames[i]) == wanted) {
                out = static_cast<Nature>(i);
                return true;
            }
        }
        return false;
    }

}
