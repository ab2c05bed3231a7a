#pragma once

#include <QByteArray>
#include <QString>

#include "gbasave/codec/LookupTables.h"

namespace GBASave::App {

// Paths of the JSON lookup tables; empty entries are skipped.
struct TablePaths {
    QString species;
    QString items;
    QString moves;
    QString charmap;
};

// Loads the JSON tables the codec takes as injected LookupTables.
//
// Id tables: { "<raw id>": { "name": "...", "id_name": "...", "id": <external id> }, ... }
// Charmap:   { "<byte>": "<text>", ... }
class TableLoader {
public:
    static bool ParseIdRemap(const QByteArray& json, Codec::IdRemap& out, QString* error = nullptr);
    static bool ParseGlyphTable(const QByteArray& json, Codec::GlyphTable& out, QString* error = nullptr);

    static bool LoadIdRemap(const QString& path, Codec::IdRemap& out, QString* error = nullptr);
    static bool LoadGlyphTable(const QString& path, Codec::GlyphTable& out, QString* error = nullptr);

    static bool Load(const TablePaths& paths, Codec::LookupTables& out, QString* error = nullptr);
};

} // namespace GBASave::App
