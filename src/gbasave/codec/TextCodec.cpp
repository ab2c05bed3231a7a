#include "gbasave/codec/TextCodec.h"

namespace GBASave::Codec {

    std::string DecodeText(const uint8_t* data, size_t length, const GlyphTable& glyphs,
                           bool zeroTerminates) {
        std::string out;
        for (size_t i = 0; i < length; ++i) {
            uint8_t code = data[i];
            if (code == kTextTerminator) break;
            if (zeroTerminates && code == 0x00) break;
            if (!glyphs.Has(code)) continue;
            out += glyphs.Find(code);
        }

        size_t first = out.find_first_not_of(' ');
        if (first == std::string::npos) return std::string();
        size_t last = out.find_last_not_of(' ');
        return out.substr(first, last - first + 1);
    }

}
