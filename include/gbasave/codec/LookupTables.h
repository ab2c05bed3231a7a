#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace GBASave::Codec {

    struct IdEntry {
        uint16_t id = 0;        // external (national / canonical) id
        std::string name;       // display name, e.g. "Treecko"
        std::string idName;     // machine name, e.g. "treecko"
        bool hasId = true;      // false: named only, id is the raw id
    };

    // Maps the ids a game stores internally onto external ids. Ids that have
    // no entry pass through unchanged in both directions.
    class IdRemap {
    public:
        void Add(uint16_t rawId, const IdEntry& entry);

        uint16_t ToExternal(uint16_t rawId) const;
        uint16_t ToRaw(uint16_t externalId) const;
        const IdEntry* Find(uint16_t rawId) const;

        size_t Size() const { return m_entries.size(); }
        bool Empty() const { return m_entries.empty(); }

    private:
        std::unordered_map<uint16_t, IdEntry> m_entries;
        std::unordered_map<uint16_t, uint16_t> m_reverse;
    };

    // One UTF-8 string per encoded byte. Empty entries are unmapped.
    class GlyphTable {
    public:
        void Set(uint8_t code, const std::string& text);
        const std::string& Find(uint8_t code) const { return m_glyphs[code]; }
        bool Has(uint8_t code) const { return !m_glyphs[code].empty(); }

        // Western-release character set: space, digits, Latin letters and
        // the punctuation that shows up in player and creature names.
        static GlyphTable Western();

    private:
        std::array<std::string, 256> m_glyphs;
    };

    // Read-only tables injected into a profile. A null pointer means
    // "no remapping" (ids pass through) or, for glyphs, the Western table.
    struct LookupTables {
        std::shared_ptr<const IdRemap> species;
        std::shared_ptr<const IdRemap> items;
        std::shared_ptr<const IdRemap> moves;
        std::shared_ptr<const GlyphTable> glyphs;
    };

}
