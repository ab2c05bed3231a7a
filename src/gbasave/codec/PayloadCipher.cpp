#include "gbasave/codec/PayloadCipher.h"
#include "gbasave/codec/ByteOrder.h"

namespace GBASave::Codec {

    namespace {
        uint32_t RecordKey(const GameProfile& profile, const std::vector<uint8_t>& record) {
            return Read32(&record[profile.record.personality]) ^ Read32(&record[profile.record.otId]);
        }

        std::vector<uint8_t> XorUnpack(const GameProfile& profile, const std::vector<uint8_t>& record) {
            const EncryptionLayout& enc = profile.encryption;
            std::vector<uint8_t> plain(enc.PayloadSize(), 0);
            if (record.size() < enc.payloadOffset + enc.PayloadSize()) return plain;

            uint32_t personality = Read32(&record[profile.record.personality]);
            uint32_t key = RecordKey(profile, record);
            SubstructOrder order = profile.substructOrder(personality);

            for (uint32_t logical = 0; logical < 4; ++logical) {
                const uint8_t* src = &record[enc.payloadOffset + order[logical] * enc.substructSize];
                uint8_t* dst = &plain[logical * enc.substructSize];
                for (uint32_t w = 0; w < enc.substructSize; w += 4) {
                    Write32(dst + w, Read32(src + w) ^ key);
                }
            }
            return plain;
        }

        void XorPack(const GameProfile& profile, const std::vector<uint8_t>& plain, std::vector<uint8_t>& record) {
            const EncryptionLayout& enc = profile.encryption;
            if (plain.size() != enc.PayloadSize()) return;
            if (record.size() < enc.payloadOffset + enc.PayloadSize()) return;

            uint32_t personality = Read32(&record[profile.record.personality]);
            uint32_t key = RecordKey(profile, record);
            SubstructOrder order = profile.substructOrder(personality);

            for (uint32_t logical = 0; logical < 4; ++logical) {
                const uint8_t* src = &plain[logical * enc.substructSize];
                uint8_t* dst = &record[enc.payloadOffset + order[logical] * enc.substructSize];
                for (uint32_t w = 0; w < enc.substructSize; w += 4) {
                    Write32(dst + w, Read32(src + w) ^ key);
                }
            }
            Write16(&record[enc.checksumOffset], PayloadChecksum(plain));
        }

        bool XorVerify(const GameProfile& profile, const std::vector<uint8_t>& record) {
            const EncryptionLayout& enc = profile.encryption;
            if (record.size() < enc.payloadOffset + enc.PayloadSize()) return false;
            return Read16(&record[enc.checksumOffset]) == PayloadChecksum(XorUnpack(profile, record));
        }

        std::vector<uint8_t> PlainUnpack(const GameProfile&, const std::vector<uint8_t>& record) {
            return record;
        }

        void PlainPack(const GameProfile&, const std::vector<uint8_t>& plain, std::vector<uint8_t>& record) {
            if (plain.size() == record.size()) record = plain;
        }

        bool PlainVerify(const GameProfile&, const std::vector<uint8_t>&) {
            return true;
        }
    }

    uint16_t PayloadChecksum(const std::vector<uint8_t>& plain) {
        uint16_t sum = 0;
        for (size_t i = 0; i + 1 < plain.size(); i += 2) {
            sum = static_cast<uint16_t>(sum + Read16(&plain[i]));
        }
        return sum;
    }

    PayloadCipher XorPermutationCipher() {
        return PayloadCipher{&XorUnpack, &XorPack, &XorVerify};
    }

    PayloadCipher PlainCipher() {
        return PayloadCipher{&PlainUnpack, &PlainPack, &PlainVerify};
    }

}
