#include "gbasave/app/TableLoader.h"

#include "gbasave/common/Logger.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>

#include <memory>

namespace GBASave::App {

using Common::Logger;
using Common::LogLevel;

namespace {

bool ReadObject(const QByteArray& json, QJsonObject& out, QString* error) {
    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error) *error = parseError.errorString();
        return false;
    }
    if (!doc.isObject()) {
        if (error) *error = "top-level value is not an object";
        return false;
    }
    out = doc.object();
    return true;
}

bool ReadFile(const QString& path, QByteArray& out, QString* error) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) *error = QString("%1: %2").arg(path, file.errorString());
        return false;
    }
    out = file.readAll();
    return true;
}

bool ParseKey(const QString& key, int maxValue, int& value) {
    bool ok = false;
    value = key.toInt(&ok, 0);
    return ok && value >= 0 && value <= maxValue;
}

} // namespace

bool TableLoader::ParseIdRemap(const QByteArray& json, Codec::IdRemap& out, QString* error) {
    QJsonObject root;
    if (!ReadObject(json, root, error)) return false;

    for (auto it = root.begin(); it != root.end(); ++it) {
        int raw = 0;
        if (!ParseKey(it.key(), 0xFFFF, raw)) {
            if (error) *error = QString("bad raw id \"%1\"").arg(it.key());
            return false;
        }
        const QJsonObject entryObj = it.value().toObject();
        const QJsonValue idValue = entryObj.value("id");

        Codec::IdEntry entry;
        if (idValue.isNull()) {
            // Named but unmapped: the raw id passes through.
            entry.id = static_cast<uint16_t>(raw);
            entry.hasId = false;
        } else {
            const int id = idValue.toInt(-1);
            if (id < 0 || id > 0xFFFF) {
                if (error) *error = QString("entry %1 has no valid \"id\"").arg(it.key());
                return false;
            }
            entry.id = static_cast<uint16_t>(id);
        }
        entry.name = entryObj.value("name").toString().toStdString();
        entry.idName = entryObj.value("id_name").toString().toStdString();
        out.Add(static_cast<uint16_t>(raw), entry);
    }
    return true;
}

bool TableLoader::ParseGlyphTable(const QByteArray& json, Codec::GlyphTable& out, QString* error) {
    QJsonObject root;
    if (!ReadObject(json, root, error)) return false;

    for (auto it = root.begin(); it != root.end(); ++it) {
        int code = 0;
        if (!ParseKey(it.key(), 0xFF, code) || !it.value().isString()) {
            if (error) *error = QString("bad charmap entry \"%1\"").arg(it.key());
            return false;
        }
        out.Set(static_cast<uint8_t>(code), it.value().toString().toStdString());
    }
    return true;
}

bool TableLoader::LoadIdRemap(const QString& path, Codec::IdRemap& out, QString* error) {
    QByteArray json;
    if (!ReadFile(path, json, error)) return false;
    return ParseIdRemap(json, out, error);
}

bool TableLoader::LoadGlyphTable(const QString& path, Codec::GlyphTable& out, QString* error) {
    QByteArray json;
    if (!ReadFile(path, json, error)) return false;
    return ParseGlyphTable(json, out, error);
}

bool TableLoader::Load(const TablePaths& paths, Codec::LookupTables& out, QString* error) {
    struct IdTable {
        const QString& path;
        std::shared_ptr<const Codec::IdRemap>& slot;
        const char* label;
    };
    IdTable idTables[] = {
        {paths.species, out.species, "species"},
        {paths.items, out.items, "items"},
        {paths.moves, out.moves, "moves"},
    };

    for (IdTable& table : idTables) {
        if (table.path.isEmpty()) continue;
        auto remap = std::make_shared<Codec::IdRemap>();
        if (!LoadIdRemap(table.path, *remap, error)) return false;
        Logger::Instance().LogFmt(LogLevel::Info, "main", "Loaded %zu %s entries from %s", remap->Size(),
                                  table.label, table.path.toStdString().c_str());
        table.slot = remap;
    }

    if (!paths.charmap.isEmpty()) {
        // Start from the built-in set so a partial charmap still decodes letters.
        auto glyphs = std::make_shared<Codec::GlyphTable>(Codec::GlyphTable::Western());
        if (!LoadGlyphTable(paths.charmap, *glyphs, error)) return false;
        out.glyphs = glyphs;
    }
    return true;
}

} // namespace GBASave::App
