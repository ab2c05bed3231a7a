#pragma once
#include <vector>

#include "gbasave/codec/GameProfile.h"
#include "gbasave/codec/SaveStatus.h"

namespace GBASave::Codec {

    struct ParseOptions;

    class ProfileDetector {
    public:
        /**
         * Try each profile in order and report the first that accepts the image.
         * A profile accepts when its signature appears in at least one sector
         * and a full load with it yields at least one non-empty, intact record.
         * @param profiles Candidates, most specific first
         * @param out Set to the accepted element of profiles on success
         * @return Ok, MalformedInput (no profile's geometry fits) or UnsupportedGame
         */
        static SaveStatus Detect(const std::vector<uint8_t>& image, const std::vector<GameProfile>& profiles,
                                 const GameProfile*& out);
        static SaveStatus Detect(const std::vector<uint8_t>& image, const std::vector<GameProfile>& profiles,
                                 const GameProfile*& out, const ParseOptions& options);

        // Criteria (a) and (b) for a single profile.
        static bool Accepts(const std::vector<uint8_t>& image, const GameProfile& profile,
                            const ParseOptions& options);
    };

}
