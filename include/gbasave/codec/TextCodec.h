#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "gbasave/codec/LookupTables.h"

namespace GBASave::Codec {

    constexpr uint8_t kTextTerminator = 0xFF;

    /**
     * Decode a fixed-width game string into UTF-8.
     * Stops at 0xFF, and at 0x00 too when zeroTerminates is set (player
     * names). Unmapped bytes are skipped; the result is trimmed.
     */
    std::string DecodeText(const uint8_t* data, size_t length, const GlyphTable& glyphs,
                           bool zeroTerminates = false);

}
