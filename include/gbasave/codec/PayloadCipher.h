#pragma once
#include "gbasave/codec/GameProfile.h"

namespace GBASave::Codec {

    // Vanilla layout: 48-byte payload at 0x20 split into four 12-byte
    // substructures, stored in personality-dependent order and XORed word
    // by word with personality ^ otId. The plain view is the 48 decrypted
    // bytes in logical order (Growth, Attacks, Condition, Misc).
    PayloadCipher XorPermutationCipher();

    // Unencrypted layout: the plain view is the whole record.
    PayloadCipher PlainCipher();

    // 16-bit sum of the little-endian u16 words of a decrypted payload.
    uint16_t PayloadChecksum(const std::vector<uint8_t>& plain);

}
