#include "gbasave/codec/LookupTables.h"

namespace GBASave::Codec {

    void IdRemap::Add(uint16_t rawId, const IdEntry& entry) {
        auto existing = m_entries.find(rawId);
        if (existing != m_entries.end() && existing->second.hasId) {
            m_reverse.erase(existing->second.id);
        }
        m_entries[rawId] = entry;
        // First raw id registered for an external id wins the reverse lookup.
        if (entry.hasId) m_reverse.emplace(entry.id, rawId);
    }

    uint16_t IdRemap::ToExternal(uint16_t rawId) const {
        auto it = m_entries.find(rawId);
        return it != m_entries.end() ? it->second.id : rawId;
    }

    uint16_t IdRemap::ToRaw(uint16_t externalId) const {
        auto it = m_reverse.find(externalId);
        return it != m_reverse.end() ? it->second : externalId;
    }

    const IdEntry* IdRemap::Find(uint16_t rawId) const {
        auto it = m_entries.find(rawId);
        return it != m_entries.end() ? &it->second : nullptr;
    }

    void GlyphTable::Set(uint8_t code, const std::string& text) {
        m_glyphs[code] = text;
    }

    GlyphTable GlyphTable::Western() {
        GlyphTable table;
        table.Set(0x00, " ");
        for (int i = 0; i < 10; ++i) {
            table.Set(static_cast<uint8_t>(0xA1 + i), std::string(1, static_cast<char>('0' + i)));
        }
        table.Set(0xAB, "!");
        table.Set(0xAC, "?");
        table.Set(0xAD, ".");
        table.Set(0xAE, "-");
        table.Set(0xB0, "\xE2\x80\xA6");    // ellipsis
        table.Set(0xB1, "\xE2\x80\x9C");    // left double quote
        table.Set(0xB2, "\xE2\x80\x9D");    // right double quote
        table.Set(0xB3, "\xE2\x80\x98");
        table.Set(0xB4, "'");
        table.Set(0xB5, "\xE2\x99\x82");    // male sign
        table.Set(0xB6, "\xE2\x99\x80");    // female sign
        table.Set(0xB8, ",");
        table.Set(0xBA, "/");
        for (int i = 0; i < 26; ++i) {
            table.Set(static_cast<uint8_t>(0xBB + i), std::string(1, static_cast<char>('A' + i)));
            table.Set(static_cast<uint8_t>(0xD5 + i), std::string(1, static_cast<char>('a' + i)));
        }
        return table;
    }

}
